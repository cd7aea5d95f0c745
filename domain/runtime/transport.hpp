#ifndef DBDOCK_RUNTIME_TRANSPORT_HPP
#define DBDOCK_RUNTIME_TRANSPORT_HPP

#include "endpoint.hpp"
#include "errors.hpp"
#include "http_message.hpp"

#include <chrono>
#include <string>

namespace dbdock::runtime {

class ITransport {
public:
  virtual ~ITransport() = default;

  // Sends one framed request and returns every byte the peer wrote back
  // before closing the connection.
  virtual GatewayResult<std::string> round_trip(const RuntimeEndpoint &endpoint,
                                                const HttpRequest &request) = 0;
};

// One connection per call, closed before returning. No pooling. The socket
// is non-blocking; connect, each write stall and each read wait are bounded
// by the idle timeout.
class UnixSocketTransport final : public ITransport {
public:
  static constexpr std::chrono::milliseconds kDefaultIdleTimeout{30000};
  static constexpr size_t kMaxResponseSize = 256 * 1024 * 1024;

  explicit UnixSocketTransport(
      std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout)
      : idle_timeout_(idle_timeout) {}

  GatewayResult<std::string> round_trip(const RuntimeEndpoint &endpoint,
                                        const HttpRequest &request) override;

private:
  std::chrono::milliseconds idle_timeout_;
};

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_TRANSPORT_HPP
