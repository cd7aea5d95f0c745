#ifndef DBDOCK_HOST_IDENTITY_PROBE_HPP
#define DBDOCK_HOST_IDENTITY_PROBE_HPP

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbdock::host {

struct ImageIdentity {
  uint32_t uid = 1000;
  uint32_t gid = 1000;
  std::string user = "default";
};

using IdentityResult = core::Result<ImageIdentity, IdentityError>;

class IIdentityProbe {
public:
  virtual ~IIdentityProbe() = default;

  // Default user identity of an image, as reported by `id` inside a
  // throwaway container.
  virtual IdentityResult probe(const std::string &image) = 0;
};

struct CommandOutput {
  int exit_code = 0;
  std::string output;
};

// Runs argv (PATH lookup on argv[0]) and captures stdout+stderr. The child is
// killed once the timeout passes.
core::Result<CommandOutput, IdentityError>
run_command(const std::vector<std::string> &argv,
            std::chrono::milliseconds timeout);

std::optional<std::string> find_executable(std::string_view name);

// Parses `uid=<n>(<name>) gid=<n>(<name>) ...`.
IdentityResult parse_identity(std::string_view output);

class CliIdentityProbe final : public IIdentityProbe {
public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

  // preferred_cli is tried first, then fallback_cli.
  CliIdentityProbe(std::string preferred_cli, std::string fallback_cli,
                   std::chrono::milliseconds timeout = kDefaultTimeout)
      : preferred_cli_(std::move(preferred_cli)),
        fallback_cli_(std::move(fallback_cli)), timeout_(timeout) {}

  IdentityResult probe(const std::string &image) override;

private:
  std::optional<std::string> resolve_cli() const;

  std::string preferred_cli_;
  std::string fallback_cli_;
  std::chrono::milliseconds timeout_;
};

} // namespace dbdock::host

#endif // DBDOCK_HOST_IDENTITY_PROBE_HPP
