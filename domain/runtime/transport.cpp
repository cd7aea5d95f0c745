#include "transport.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

namespace dbdock::runtime {

namespace {

class SocketHandle {
public:
  explicit SocketHandle(int fd) : fd_(fd) {}
  ~SocketHandle() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  SocketHandle(const SocketHandle &) = delete;
  SocketHandle &operator=(const SocketHandle &) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

private:
  int fd_;
};

GatewayError connect_error(const std::string &path, int err) {
  return GatewayError::transport(
      fmt::format("gateway unreachable: connect({}) failed: {}", path,
                  std::strerror(err)));
}

// Waits for `events` on a non-blocking fd. Ok(false) means the idle window
// passed without the fd becoming ready.
GatewayResult<bool> wait_ready(int fd, short events,
                               std::chrono::milliseconds timeout) {
  pollfd pfd = {fd, events, 0};
  while (true) {
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      return GatewayResult<bool>::Error(GatewayError::transport(
          fmt::format("poll() failed: {}", std::strerror(errno))));
    }
    return GatewayResult<bool>::Ok(ready > 0);
  }
}

// A Unix socket whose listen backlog is full answers EAGAIN instead of
// EINPROGRESS, so the attempt is repeated until the idle window runs out.
GatewayStatus connect_within(int fd, const sockaddr_un &addr,
                             const std::string &path,
                             std::chrono::milliseconds timeout) {
  using namespace std::chrono_literals;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (::connect(fd, reinterpret_cast<const sockaddr *>(&addr),
                   sizeof(addr)) < 0) {
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return GatewayStatus::Error(GatewayError::timeout(fmt::format(
            "connect({}) timed out: listen backlog full", path)));
      }
      std::this_thread::sleep_for(10ms);
      continue;
    }
    if (errno != EINPROGRESS) {
      return GatewayStatus::Error(connect_error(path, errno));
    }

    auto ready = wait_ready(fd, POLLOUT, timeout);
    if (ready.is_err()) {
      return GatewayStatus::Error(std::move(ready).error());
    }
    if (!ready.value()) {
      return GatewayStatus::Error(GatewayError::timeout(
          fmt::format("connect({}) timed out after {} ms", path,
                      timeout.count())));
    }
    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
      err = errno;
    }
    if (err != 0) {
      return GatewayStatus::Error(connect_error(path, err));
    }
    break;
  }
  return core::ok_status<GatewayError>();
}

GatewayStatus send_all(int fd, const std::string &data,
                       std::chrono::milliseconds timeout) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(fd, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        auto ready = wait_ready(fd, POLLOUT, timeout);
        if (ready.is_err()) {
          return GatewayStatus::Error(std::move(ready).error());
        }
        if (!ready.value()) {
          return GatewayStatus::Error(GatewayError::timeout(fmt::format(
              "timed out writing request to socket after {} of {} bytes",
              sent, data.size())));
        }
        continue;
      }
      return GatewayStatus::Error(GatewayError::transport(
          fmt::format("write to socket failed: {}", std::strerror(errno))));
    }
    sent += static_cast<size_t>(n);
  }
  return core::ok_status<GatewayError>();
}

} // namespace

GatewayResult<std::string>
UnixSocketTransport::round_trip(const RuntimeEndpoint &endpoint,
                                const HttpRequest &request) {
  using Out = GatewayResult<std::string>;
  const auto &path = endpoint.socket_path();

  sockaddr_un addr{};
  if (path.size() >= sizeof(addr.sun_path)) {
    return Out::Error(
        GatewayError::transport(fmt::format("socket path too long: {}", path)));
  }

  SocketHandle socket(
      ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0));
  if (!socket.valid()) {
    return Out::Error(GatewayError::transport(
        fmt::format("socket() failed: {}", std::strerror(errno))));
  }

  addr.sun_family = AF_UNIX;
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

  auto connected = connect_within(socket.get(), addr, path, idle_timeout_);
  if (connected.is_err()) {
    return Out::Error(std::move(connected).error());
  }

  spdlog::debug("{} {} via {}", request.method, request.target, path);

  auto written = send_all(socket.get(), request.frame(), idle_timeout_);
  if (written.is_err()) {
    return Out::Error(std::move(written).error());
  }

  std::string response;
  char buf[16384];

  while (true) {
    auto ready = wait_ready(socket.get(), POLLIN, idle_timeout_);
    if (ready.is_err()) {
      return Out::Error(std::move(ready).error());
    }
    if (!ready.value()) {
      spdlog::warn("Socket idle for {} ms on {} {}", idle_timeout_.count(),
                   request.method, request.target);
      return Out::Error(GatewayError::timeout(
          fmt::format("socket connection timeout after {} ms",
                      idle_timeout_.count())));
    }

    ssize_t n = ::read(socket.get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      return Out::Error(GatewayError::transport(
          fmt::format("read() failed: {}", std::strerror(errno))));
    }
    if (n == 0) {
      break;
    }

    response.append(buf, static_cast<size_t>(n));
    if (response.size() > kMaxResponseSize) {
      return Out::Error(GatewayError::transport(
          fmt::format("response exceeds {} bytes", kMaxResponseSize)));
    }
  }

  return Out::Ok(std::move(response));
}

} // namespace dbdock::runtime
