#include "endpoint.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace dbdock::runtime {

RuntimeEndpoint RuntimeEndpoint::from_path(std::string socket_path) {
  auto dialect = socket_path.find("docker.sock") != std::string::npos
                     ? Dialect::Docker
                     : Dialect::Podman;
  return RuntimeEndpoint(std::move(socket_path), dialect);
}

std::vector<std::string> default_socket_candidates() {
  return {
      "/var/run/docker.sock",
      fmt::format("/run/user/{}/podman/podman.sock", getuid()),
      "/run/podman/podman.sock",
      "/var/run/podman/podman.sock",
  };
}

GatewayResult<RuntimeEndpoint>
discover_endpoint(const std::vector<std::string> &candidates) {
  for (const auto &candidate : candidates) {
    struct stat st {};
    if (::stat(candidate.c_str(), &st) != 0) {
      continue;
    }
    if (S_ISSOCK(st.st_mode)) {
      spdlog::info("Found container runtime socket at {}", candidate);
      return RuntimeEndpoint::from_path(candidate);
    }
    spdlog::debug("{} exists but is not a socket", candidate);
  }

  return GatewayResult<RuntimeEndpoint>::Error(GatewayError::transport(
      fmt::format("no container runtime socket found (tried: {})",
                  fmt::join(candidates, ", "))));
}

} // namespace dbdock::runtime
