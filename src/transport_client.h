#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "errors.h"
#include "http_wire.h"
#include "operation.h"

namespace inkshell {

// One request/response exchange with the device. Implementations never retry.
class Transport {
 public:
  virtual ~Transport() = default;

  // Returns false and fills `err` with a transport-domain kind on failure. Any HTTP
  // status other than busy is a successful exchange; the session judges it.
  virtual bool send(const Operation& op, std::chrono::milliseconds timeout,
                    HttpResponse& out, DeviceError& err) = 0;

  virtual std::string address() const = 0;
};

// HTTP/1.1 over a plain TCP socket, one connection per request.
// `host` may be an IP literal or a name; name lookup blocks and counts against
// the per-call timeout, so a lookup slower than the timeout fails with Timeout.
class HttpTransport : public Transport {
 public:
  HttpTransport(std::string host, int port, std::size_t max_payload_bytes, bool verbose = false);

  bool send(const Operation& op, std::chrono::milliseconds timeout,
            HttpResponse& out, DeviceError& err) override;

  std::string address() const override;
  std::size_t max_payload_bytes() const { return max_payload_bytes_; }

 private:
  bool exchange(const std::vector<std::uint8_t>& wire, std::chrono::milliseconds timeout,
                HttpResponse& out, DeviceError& err) const;

  std::string host_;
  int port_;
  std::size_t max_payload_bytes_;
  bool verbose_;
};

} // namespace inkshell
