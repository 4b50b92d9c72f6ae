#include "device_session.h"

#include <algorithm>

#include "device_protocol.h"
#include "log.h"
#include "status_cache.h"

namespace inkshell {

const char* state_name(ConnectivityState s) {
  switch (s) {
    case ConnectivityState::Unknown:     return "Unknown";
    case ConnectivityState::Probing:     return "Probing";
    case ConnectivityState::Awake:       return "Awake";
    case ConnectivityState::Asleep:      return "Asleep";
    case ConnectivityState::Unreachable: return "Unreachable";
  }
  return "Unknown";
}

static std::string body_excerpt(const std::string& body) {
  std::string s = trim_copy(body);
  if (s.size() > 160) s = s.substr(0, 160) + "...";
  return s;
}

// ----------------------------
// Slot
// ----------------------------
DeviceSession::Slot::~Slot() {
  if (session_) session_->release();
}

bool DeviceSession::Slot::perform(const Operation& op, HttpResponse& out, DeviceError& err,
                                  const CancelToken* cancel) {
  if (!session_) {
    err = make_error(ErrorKind::OperationRejected, {}, "session slot already released");
    return false;
  }
  return session_->perform_held(op, out, err, cancel);
}

// ----------------------------
// DeviceSession
// ----------------------------
DeviceSession::DeviceSession(Transport& transport, SessionOptions opts, StatusCache* cache)
    : transport_(transport), opts_(opts), cache_(cache) {
  opts_.wake_retries = std::max(1, opts_.wake_retries);
  opts_.retry_attempts = std::max(1, opts_.retry_attempts);
}

DeviceSession::Slot DeviceSession::acquire() {
  std::unique_lock<std::mutex> lk(gate_mtx_);
  const std::uint64_t ticket = next_ticket_++;
  gate_cv_.wait(lk, [&] { return now_serving_ == ticket; });
  in_flight_.store(true, std::memory_order_relaxed);
  return Slot(this);
}

void DeviceSession::release() {
  {
    std::lock_guard<std::mutex> lk(gate_mtx_);
    ++now_serving_;
    in_flight_.store(false, std::memory_order_relaxed);
  }
  gate_cv_.notify_all();
}

std::size_t DeviceSession::waiting() const {
  std::lock_guard<std::mutex> lk(gate_mtx_);
  const std::uint64_t pending = next_ticket_ - now_serving_;
  return pending > 0 ? static_cast<std::size_t>(pending - (in_flight_ ? 1 : 0)) : 0;
}

bool DeviceSession::perform(const Operation& op, HttpResponse& out, DeviceError& err,
                            const CancelToken* cancel) {
  Slot slot = acquire();
  return slot.perform(op, out, err, cancel);
}

ConnectivityState DeviceSession::state() const {
  std::lock_guard<std::mutex> lk(state_mtx_);
  return state_;
}

std::optional<std::chrono::system_clock::time_point> DeviceSession::last_contact() const {
  std::lock_guard<std::mutex> lk(state_mtx_);
  return last_contact_;
}

DeviceError DeviceSession::last_error() const {
  std::lock_guard<std::mutex> lk(state_mtx_);
  return last_error_;
}

void DeviceSession::set_state(ConnectivityState s) {
  ConnectivityState prev;
  {
    std::lock_guard<std::mutex> lk(state_mtx_);
    prev = state_;
    state_ = s;
  }
  if (prev != s && s != ConnectivityState::Probing && opts_.verbose) {
    LOGI("[session] " << address() << " " << state_name(prev) << " -> " << state_name(s));
  }
}

void DeviceSession::note_contact() {
  std::lock_guard<std::mutex> lk(state_mtx_);
  last_contact_ = std::chrono::system_clock::now();
}

void DeviceSession::note_error(const DeviceError& e) {
  std::lock_guard<std::mutex> lk(state_mtx_);
  last_error_ = e;
}

DeviceError DeviceSession::cancelled_error() const {
  return make_error(ErrorKind::Cancelled, address(), "cancelled before the request was sent");
}

bool DeviceSession::backoff(int attempt, const CancelToken* cancel) const {
  const int shift = std::min(attempt - 1, 3);
  const auto delay = opts_.retry_backoff * (1 << std::max(shift, 0));
  return interruptible_sleep(delay, cancel);
}

bool DeviceSession::probe(HttpResponse* out, DeviceError& err, const CancelToken* cancel) {
  const ConnectivityState before = state();
  set_state(ConnectivityState::Probing);
  const Operation whistle = make_operation(OperationKind::Wake);

  DeviceError last;
  for (int attempt = 1; attempt <= opts_.wake_retries; ++attempt) {
    if (is_cancelled(cancel)) {
      set_state(before);
      err = cancelled_error();
      return false;
    }
    HttpResponse resp;
    if (transport_.send(whistle, opts_.probe_timeout, resp, last)) {
      // any HTTP answer means the device is up
      note_contact();
      set_state(ConnectivityState::Awake);
      if (out) *out = std::move(resp);
      return true;
    }
    if (last.kind == ErrorKind::DeviceBusy || last.kind == ErrorKind::MalformedResponse) {
      note_contact();
      set_state(ConnectivityState::Awake);
      if (out) out->status = last.http_status;
      return true;
    }
    if (opts_.verbose) {
      LOGD("[session] wake probe " << attempt << "/" << opts_.wake_retries << " failed: "
           << error_to_name(last.kind) << " " << last.detail);
    }
    if (attempt < opts_.wake_retries && !backoff(attempt, cancel)) {
      set_state(ConnectivityState::Unreachable);
      err = cancelled_error();
      return false;
    }
  }

  set_state(ConnectivityState::Unreachable);
  err = make_error(ErrorKind::Unreachable, address(),
                   "no answer to wake probe after " + std::to_string(opts_.wake_retries) +
                   " attempt(s); last: " + error_to_name(last.kind) +
                   (last.detail.empty() ? "" : " " + last.detail));
  note_error(err);
  return false;
}

bool DeviceSession::perform_held(const Operation& op, HttpResponse& out, DeviceError& err,
                                 const CancelToken* cancel) {
  if (is_cancelled(cancel)) {
    err = cancelled_error();
    return false;
  }

  const bool awake = (state() == ConnectivityState::Awake);
  if (!awake) {
    // the wake operation is the probe loop itself
    if (op.kind == OperationKind::Wake) return probe(&out, err, cancel);
    if (!probe(nullptr, err, cancel)) return false;
  }

  const RetryPolicy policy = retry_policy(op.kind);
  const int attempts = (policy == RetryPolicy::AutoRetry) ? opts_.retry_attempts : 1;
  const auto timeout = is_upload(op.kind) ? opts_.upload_timeout : opts_.timeout;

  for (int attempt = 1;; ++attempt) {
    DeviceError terr;
    if (transport_.send(op, timeout, out, terr)) {
      note_contact();
      set_state(ConnectivityState::Awake);
      if (!out.ok()) {
        err = make_error(ErrorKind::OperationRejected, address(),
                         std::string(operation_name(op.kind)) + " rejected: " + body_excerpt(out.body),
                         out.status);
        note_error(err);
        return false;
      }
      on_success(op, out);
      return true;
    }

    switch (terr.kind) {
      case ErrorKind::Timeout:
        set_state(ConnectivityState::Unreachable);
        note_error(terr);
        if (attempt < attempts) {
          if (opts_.verbose) {
            LOGD("[session] " << operation_name(op.kind) << " timed out, attempt " << attempt << "/" << attempts);
          }
          if (!backoff(attempt, cancel)) {
            err = cancelled_error();
            return false;
          }
          continue;
        }
        if (policy == RetryPolicy::AutoRetry) {
          err = make_error(ErrorKind::Unreachable, address(),
                           std::string(operation_name(op.kind)) + " timed out " + std::to_string(attempts) +
                           " time(s)");
          note_error(err);
        } else {
          err = terr;
        }
        return false;

      case ErrorKind::ConnectionRefused:
        set_state(ConnectivityState::Unreachable);
        break;

      case ErrorKind::DeviceBusy:
      case ErrorKind::MalformedResponse:
        // the device answered
        note_contact();
        set_state(ConnectivityState::Awake);
        break;

      default:
        break;
    }
    err = terr;
    note_error(err);
    return false;
  }
}

void DeviceSession::on_success(const Operation& op, const HttpResponse& resp) {
  switch (op.kind) {
    case OperationKind::Sleep:
      set_state(ConnectivityState::Asleep);
      break;
    case OperationKind::Reboot:
      set_state(ConnectivityState::Unknown);
      break;
    case OperationKind::RefreshInfo:
      if (cache_) {
        DeviceStatus st;
        std::string perr;
        if (parse_device_info(resp.body, st, perr)) {
          if (auto prev = cache_->latest()) {
            st.galleries = prev->galleries;
            st.galleries_known = prev->galleries_known;
          }
          cache_->store(std::move(st));
        } else if (opts_.verbose) {
          LOGD("[session] device info not cached: " << perr);
        }
      }
      break;
    default:
      break;
  }
}

} // namespace inkshell
