#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "device_protocol.h"
#include "device_session.h"
#include "errors.h"
#include "util.h"

namespace inkshell {

// Last-known device status. Reads never touch the network; refresh() goes through
// the session like any other caller.
class StatusCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit StatusCache(NowFn now = {});

  // The snapshot if it is at most `max_age` old; nullopt means stale (or never fetched).
  std::optional<DeviceStatus> get(std::chrono::milliseconds max_age) const;

  // Latest snapshot regardless of age; null before the first store.
  std::shared_ptr<const DeviceStatus> latest() const;
  std::optional<std::chrono::milliseconds> age() const;

  // Replace the snapshot wholesale.
  void store(DeviceStatus status);

  // Device info, gallery list and per-gallery counts, under one session slot.
  bool refresh(DeviceSession& session, DeviceStatus& out, DeviceError& err,
               const CancelToken* cancel = nullptr);
  bool refresh(DeviceSession::Slot& slot, DeviceStatus& out, DeviceError& err,
               const CancelToken* cancel = nullptr);

 private:
  NowFn now_;
  mutable std::mutex mtx_;
  std::shared_ptr<const DeviceStatus> snap_;
  Clock::time_point stored_at_{};
};

} // namespace inkshell
