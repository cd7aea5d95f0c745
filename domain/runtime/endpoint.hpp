#ifndef DBDOCK_RUNTIME_ENDPOINT_HPP
#define DBDOCK_RUNTIME_ENDPOINT_HPP

#include "errors.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace dbdock::runtime {

enum class Dialect { Docker, Podman };

constexpr std::string_view to_string(Dialect dialect) {
  return dialect == Dialect::Docker ? "docker" : "podman";
}

// A reachable runtime socket. The dialect is fixed at construction and
// every request issued through this endpoint uses it.
class RuntimeEndpoint {
public:
  static RuntimeEndpoint from_path(std::string socket_path);

  const std::string &socket_path() const { return socket_path_; }
  Dialect dialect() const { return dialect_; }

  // Name of the runtime CLI matching the dialect.
  std::string_view cli_name() const { return to_string(dialect_); }

private:
  RuntimeEndpoint(std::string socket_path, Dialect dialect)
      : socket_path_(std::move(socket_path)), dialect_(dialect) {}

  std::string socket_path_;
  Dialect dialect_;
};

std::vector<std::string> default_socket_candidates();

// First candidate that exists and is a socket.
GatewayResult<RuntimeEndpoint>
discover_endpoint(const std::vector<std::string> &candidates);

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_ENDPOINT_HPP
