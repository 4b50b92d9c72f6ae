#pragma once

#include <chrono>
#include <string>

namespace inkshell {

// Transport, session and sync-item failures share one enumeration; error_domain()
// tells them apart.
enum class ErrorKind {
  None,
  // transport
  ConnectionRefused,
  Timeout,
  MalformedResponse,
  DeviceBusy,
  PayloadTooLarge,
  // session
  Unreachable,
  OperationRejected,
  Cancelled,
  // sync item
  UploadRejected,
  FormatUnsupported,
  QuotaExceeded,
  SourceUnreadable,
};

enum class ErrorDomain { None, Transport, Session, SyncItem };

const char* error_to_name(ErrorKind kind);
ErrorDomain error_domain(ErrorKind kind);
const char* error_domain_name(ErrorDomain domain);

struct DeviceError {
  ErrorKind kind = ErrorKind::None;
  std::string address;                           // host:port of the device
  std::chrono::system_clock::time_point when{};
  int http_status = 0;                           // 0 when no HTTP status was received
  std::string detail;

  bool ok() const { return kind == ErrorKind::None; }
  std::string describe() const;
};

DeviceError make_error(ErrorKind kind, const std::string& address, std::string detail, int http_status = 0);

std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace inkshell
