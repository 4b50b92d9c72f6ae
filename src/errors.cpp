#include "errors.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace inkshell {

const char* error_to_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:              return "None";
    case ErrorKind::ConnectionRefused: return "ConnectionRefused";
    case ErrorKind::Timeout:           return "Timeout";
    case ErrorKind::MalformedResponse: return "MalformedResponse";
    case ErrorKind::DeviceBusy:        return "DeviceBusy";
    case ErrorKind::PayloadTooLarge:   return "PayloadTooLarge";
    case ErrorKind::Unreachable:       return "Unreachable";
    case ErrorKind::OperationRejected: return "OperationRejected";
    case ErrorKind::Cancelled:         return "Cancelled";
    case ErrorKind::UploadRejected:    return "UploadRejected";
    case ErrorKind::FormatUnsupported: return "FormatUnsupported";
    case ErrorKind::QuotaExceeded:     return "QuotaExceeded";
    case ErrorKind::SourceUnreadable:  return "SourceUnreadable";
  }
  return "Unknown";
}

ErrorDomain error_domain(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return ErrorDomain::None;
    case ErrorKind::ConnectionRefused:
    case ErrorKind::Timeout:
    case ErrorKind::MalformedResponse:
    case ErrorKind::DeviceBusy:
    case ErrorKind::PayloadTooLarge:
      return ErrorDomain::Transport;
    case ErrorKind::Unreachable:
    case ErrorKind::OperationRejected:
    case ErrorKind::Cancelled:
      return ErrorDomain::Session;
    case ErrorKind::UploadRejected:
    case ErrorKind::FormatUnsupported:
    case ErrorKind::QuotaExceeded:
    case ErrorKind::SourceUnreadable:
      return ErrorDomain::SyncItem;
  }
  return ErrorDomain::None;
}

const char* error_domain_name(ErrorDomain domain) {
  switch (domain) {
    case ErrorDomain::None:      return "none";
    case ErrorDomain::Transport: return "transport";
    case ErrorDomain::Session:   return "session";
    case ErrorDomain::SyncItem:  return "sync";
  }
  return "unknown";
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string DeviceError::describe() const {
  std::ostringstream oss;
  oss << error_domain_name(error_domain(kind)) << " error " << error_to_name(kind);
  if (!address.empty()) oss << " @ " << address;
  if (http_status != 0) oss << " (HTTP " << http_status << ")";
  if (when.time_since_epoch().count() != 0) oss << " at " << format_timestamp(when);
  if (!detail.empty()) oss << ": " << detail;
  return oss.str();
}

DeviceError make_error(ErrorKind kind, const std::string& address, std::string detail, int http_status) {
  DeviceError e;
  e.kind = kind;
  e.address = address;
  e.when = std::chrono::system_clock::now();
  e.http_status = http_status;
  e.detail = std::move(detail);
  return e;
}

} // namespace inkshell
