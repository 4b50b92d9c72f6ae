#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "errors.h"
#include "http_wire.h"
#include "operation.h"
#include "transport_client.h"
#include "util.h"

namespace inkshell {

class StatusCache;

enum class ConnectivityState { Unknown, Probing, Awake, Asleep, Unreachable };

const char* state_name(ConnectivityState s);

struct SessionOptions {
  int wake_retries = 3;                           // probe attempts before Unreachable
  int retry_attempts = 3;                         // total attempts for auto-retried kinds
  std::chrono::milliseconds retry_backoff{500};   // doubled per attempt, capped at 8x
  std::chrono::milliseconds timeout{10000};
  std::chrono::milliseconds upload_timeout{30000};
  std::chrono::milliseconds probe_timeout{3000};
  bool verbose = false;
};

// Owns the connectivity state of one device and serializes every exchange with it.
// Callers queue in FIFO order; at most one operation is on the wire.
class DeviceSession {
 public:
  // Exclusive hold on the device. Obtained from acquire(); released on destruction.
  class Slot {
   public:
    Slot(Slot&& other) noexcept : session_(other.session_) { other.session_ = nullptr; }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot& operator=(Slot&&) = delete;
    ~Slot();

    bool perform(const Operation& op, HttpResponse& out, DeviceError& err,
                 const CancelToken* cancel = nullptr);
    std::string address() const { return session_ ? session_->address() : std::string(); }

   private:
    friend class DeviceSession;
    explicit Slot(DeviceSession* s) : session_(s) {}
    DeviceSession* session_;
  };

  DeviceSession(Transport& transport, SessionOptions opts, StatusCache* cache = nullptr);
  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  // Blocks until every earlier caller has released the device.
  Slot acquire();

  // acquire() + one operation.
  bool perform(const Operation& op, HttpResponse& out, DeviceError& err,
               const CancelToken* cancel = nullptr);

  ConnectivityState state() const;
  std::optional<std::chrono::system_clock::time_point> last_contact() const;
  DeviceError last_error() const;
  bool busy() const { return in_flight_.load(std::memory_order_relaxed); }
  std::size_t waiting() const;
  std::string address() const { return transport_.address(); }
  const SessionOptions& options() const { return opts_; }

 private:
  void release();
  bool perform_held(const Operation& op, HttpResponse& out, DeviceError& err, const CancelToken* cancel);
  bool probe(HttpResponse* out, DeviceError& err, const CancelToken* cancel);
  bool backoff(int attempt, const CancelToken* cancel) const;
  void on_success(const Operation& op, const HttpResponse& resp);
  void set_state(ConnectivityState s);
  void note_contact();
  void note_error(const DeviceError& e);
  DeviceError cancelled_error() const;

  Transport& transport_;
  SessionOptions opts_;
  StatusCache* cache_;

  // FIFO gate
  mutable std::mutex gate_mtx_;
  std::condition_variable gate_cv_;
  std::uint64_t next_ticket_ = 0;
  std::uint64_t now_serving_ = 0;
  std::atomic<bool> in_flight_{false};

  mutable std::mutex state_mtx_;
  ConnectivityState state_ = ConnectivityState::Unknown;
  std::optional<std::chrono::system_clock::time_point> last_contact_;
  DeviceError last_error_;
};

} // namespace inkshell
