#include "transport_client.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "device_protocol.h"
#include "log.h"

namespace inkshell {

namespace {

using Clock = std::chrono::steady_clock;

// Closes the descriptor on every exit path.
class SocketFd {
 public:
  SocketFd() = default;
  ~SocketFd() { reset(); }
  SocketFd(const SocketFd&) = delete;
  SocketFd& operator=(const SocketFd&) = delete;

  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
  int get() const { return fd_; }

 private:
  int fd_ = -1;
};

int remaining_ms(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<long long>(left, 60 * 60 * 1000));
}

// 0 = ready, 1 = deadline passed, -1 = poll error (errno set)
int wait_fd(int fd, short events, Clock::time_point deadline) {
  for (;;) {
    int ms = remaining_ms(deadline);
    if (ms == 0) return 1;
    struct pollfd p{};
    p.fd = fd;
    p.events = events;
    int r = ::poll(&p, 1, ms);
    if (r > 0) return 0;
    if (r == 0) return 1;
    if (errno == EINTR) continue;
    return -1;
  }
}

bool is_refusal_errno(int e) {
  return e == ECONNREFUSED || e == EHOSTUNREACH || e == ENETUNREACH ||
         e == ECONNRESET || e == EHOSTDOWN || e == ENETDOWN || e == EPIPE;
}

} // namespace

HttpTransport::HttpTransport(std::string host, int port, std::size_t max_payload_bytes, bool verbose)
    : host_(std::move(host)), port_(port), max_payload_bytes_(max_payload_bytes), verbose_(verbose) {}

std::string HttpTransport::address() const {
  return host_ + ":" + std::to_string(port_);
}

bool HttpTransport::send(const Operation& op, std::chrono::milliseconds timeout,
                         HttpResponse& out, DeviceError& err) {
  if (max_payload_bytes_ > 0 && op.payload_size() > max_payload_bytes_) {
    err = make_error(ErrorKind::PayloadTooLarge, address(),
                     std::to_string(op.payload_size()) + " bytes exceeds limit of " +
                     std::to_string(max_payload_bytes_));
    return false;
  }

  HttpRequest req = build_device_request(op);
  if (verbose_) {
    LOGD("[http] " << req.method << " " << address() << req.target << " (" << req.body.size()
         << " bytes, timeout " << timeout.count() << " ms)");
  }
  const std::vector<std::uint8_t> wire = serialize_request(req, host_, port_);
  if (!exchange(wire, timeout, out, err)) return false;

  if (out.status == 503 || out.status == 429) {
    err = make_error(ErrorKind::DeviceBusy, address(), out.reason, out.status);
    return false;
  }
  if (verbose_) LOGD("[http] " << req.target << " -> " << out.status << " (" << out.body.size() << " bytes)");
  return true;
}

bool HttpTransport::exchange(const std::vector<std::uint8_t>& wire, std::chrono::milliseconds timeout,
                             HttpResponse& out, DeviceError& err) const {
  const auto deadline = Clock::now() + timeout;
  const std::string addr = address();

  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  const std::string port_str = std::to_string(port_);
  int gai = ::getaddrinfo(host_.c_str(), port_str.c_str(), &hints, &res);
  if (gai != 0 || !res) {
    err = make_error(ErrorKind::ConnectionRefused, addr, std::string("resolve failed: ") + gai_strerror(gai));
    return false;
  }
  // getaddrinfo cannot be interrupted, so a slow lookup is charged against the budget here
  if (Clock::now() >= deadline) {
    ::freeaddrinfo(res);
    err = make_error(ErrorKind::Timeout, addr, "name resolution used up the call timeout");
    return false;
  }

  SocketFd sock;
  int last_errno = 0;
  bool timed_out = false;
  for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) { last_errno = errno; continue; }
    sock.reset(fd);

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
    if (errno != EINPROGRESS) { last_errno = errno; sock.reset(); continue; }

    int w = wait_fd(fd, POLLOUT, deadline);
    if (w == 1) { timed_out = true; sock.reset(); break; }
    if (w < 0) { last_errno = errno; sock.reset(); continue; }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) so_error = errno;
    if (so_error == 0) break;
    last_errno = so_error;
    sock.reset();
  }
  ::freeaddrinfo(res);

  if (sock.get() < 0) {
    if (timed_out) {
      err = make_error(ErrorKind::Timeout, addr, "connect timed out after " + std::to_string(timeout.count()) + " ms");
    } else if (last_errno == ETIMEDOUT) {
      err = make_error(ErrorKind::Timeout, addr, std::strerror(last_errno));
    } else {
      err = make_error(ErrorKind::ConnectionRefused, addr,
                       last_errno ? std::strerror(last_errno) : "no usable address");
    }
    return false;
  }

  // write request
  size_t sent = 0;
  while (sent < wire.size()) {
    ssize_t n = ::send(sock.get(), wire.data() + sent, wire.size() - sent, MSG_NOSIGNAL);
    if (n > 0) { sent += static_cast<size_t>(n); continue; }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      int w = wait_fd(sock.get(), POLLOUT, deadline);
      if (w == 1) {
        err = make_error(ErrorKind::Timeout, addr, "send timed out after " + std::to_string(sent) + " bytes");
        return false;
      }
      if (w == 0) continue;
    }
    int e = errno;
    err = make_error(is_refusal_errno(e) ? ErrorKind::ConnectionRefused : ErrorKind::MalformedResponse,
                     addr, std::string("send failed: ") + std::strerror(e));
    return false;
  }

  // read response
  std::string raw;
  char buf[4096];
  std::string perr;
  for (;;) {
    int w = wait_fd(sock.get(), POLLIN, deadline);
    if (w == 1) {
      err = make_error(ErrorKind::Timeout, addr,
                       raw.empty() ? "no response" : "response incomplete after " + std::to_string(raw.size()) + " bytes");
      return false;
    }
    if (w < 0) {
      err = make_error(ErrorKind::ConnectionRefused, addr, std::string("poll failed: ") + std::strerror(errno));
      return false;
    }
    ssize_t n = ::recv(sock.get(), buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
      int e = errno;
      // a reset after some bytes arrived is judged on what we have
      if (raw.empty()) {
        err = make_error(is_refusal_errno(e) ? ErrorKind::ConnectionRefused : ErrorKind::MalformedResponse,
                         addr, std::string("recv failed: ") + std::strerror(e));
        return false;
      }
      n = 0;
    }
    const bool eof = (n == 0);
    if (n > 0) raw.append(buf, static_cast<size_t>(n));

    ParseState st = parse_response(raw, eof, out, perr);
    if (st == ParseState::Complete) return true;
    if (st == ParseState::Malformed) {
      err = make_error(ErrorKind::MalformedResponse, addr, perr);
      return false;
    }
    if (eof) {
      err = make_error(ErrorKind::MalformedResponse, addr, "connection closed mid-response");
      return false;
    }
  }
}

} // namespace inkshell
