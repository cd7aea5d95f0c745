#include "identity_probe.hpp"
#include "numeric_id.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

namespace dbdock::host {

namespace {

IdentityError command_failed(std::string message) {
  return IdentityError(IdentityErrorKind::CommandFailed, std::move(message));
}

int wait_for(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::optional<std::string> find_executable(std::string_view name) {
  if (name.find('/') != std::string_view::npos) {
    std::string path(name);
    if (::access(path.c_str(), X_OK) != 0) {
      return std::nullopt;
    }
    return path;
  }

  const char *env = std::getenv("PATH");
  std::string search = env ? env : "/usr/local/bin:/usr/bin:/bin";
  std::vector<std::string> dirs;
  boost::algorithm::split(dirs, search, boost::is_any_of(":"));

  for (const auto &dir : dirs) {
    if (dir.empty()) {
      continue;
    }
    auto candidate = fmt::format("{}/{}", dir, name);
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

core::Result<CommandOutput, IdentityError>
run_command(const std::vector<std::string> &argv,
            std::chrono::milliseconds timeout) {
  using Out = core::Result<CommandOutput, IdentityError>;
  if (argv.empty()) {
    return Out::Error(command_failed("empty command line"));
  }

  // Built before fork(): the child may only make async-signal-safe calls.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    return Out::Error(
        command_failed(fmt::format("pipe: {}", std::strerror(errno))));
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    int err = errno;
    ::close(fds[0]);
    ::close(fds[1]);
    return Out::Error(command_failed(fmt::format("fork: {}", std::strerror(err))));
  }

  if (pid == 0) {
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    ::dup2(fds[1], STDOUT_FILENO);
    ::dup2(fds[1], STDERR_FILENO);
    ::execvp(args[0], args.data());
    _exit(127);
  }

  ::close(fds[1]);

  CommandOutput result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  bool timed_out = false;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }

    pollfd pfd = {fds[0], POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    result.output.append(buffer, static_cast<size_t>(n));
  }
  ::close(fds[0]);

  if (timed_out) {
    ::kill(pid, SIGKILL);
    wait_for(pid);
    return Out::Error(command_failed(
        fmt::format("'{}' timed out after {} ms", argv.front(),
                    timeout.count())));
  }

  result.exit_code = wait_for(pid);
  return Out::Ok(std::move(result));
}

IdentityResult parse_identity(std::string_view output) {
  static const boost::regex uid_pattern(R"(uid=(\d+)(?:\(([^)]*)\))?)");
  static const boost::regex gid_pattern(R"(gid=(\d+)(?:\(([^)]*)\))?)");

  std::string text(output);
  boost::smatch uid_match;
  boost::smatch gid_match;
  if (!boost::regex_search(text, uid_match, uid_pattern) ||
      !boost::regex_search(text, gid_match, gid_pattern)) {
    return IdentityResult::Error(
        IdentityError(IdentityErrorKind::UnparsableOutput,
                      "Unable to parse user information from container "
                      "output"));
  }

  auto uid = parse_numeric_id(uid_match[1].str());
  auto gid = parse_numeric_id(gid_match[1].str());
  if (!uid || !gid) {
    return IdentityResult::Error(IdentityError(
        IdentityErrorKind::UnparsableOutput,
        fmt::format("uid/gid out of range in container output: uid={} gid={}",
                    uid_match[1].str(), gid_match[1].str())));
  }

  ImageIdentity identity;
  identity.uid = *uid;
  identity.gid = *gid;
  identity.user = uid_match[2].matched && uid_match[2].length() > 0
                      ? uid_match[2].str()
                      : std::string("unknown");
  return IdentityResult::Ok(std::move(identity));
}

std::optional<std::string> CliIdentityProbe::resolve_cli() const {
  if (find_executable(preferred_cli_)) {
    return preferred_cli_;
  }
  if (!fallback_cli_.empty() && find_executable(fallback_cli_)) {
    spdlog::warn("{} not found on PATH, using {}", preferred_cli_,
                 fallback_cli_);
    return fallback_cli_;
  }
  return std::nullopt;
}

IdentityResult CliIdentityProbe::probe(const std::string &image) {
  auto cli = resolve_cli();
  if (!cli) {
    return IdentityResult::Error(IdentityError(
        IdentityErrorKind::CliUnavailable,
        fmt::format("Neither {} nor {} command is available in PATH",
                    preferred_cli_, fallback_cli_)));
  }

  spdlog::info("Running: {} run --rm {} id", *cli, image);
  auto ran = run_command({*cli, "run", "--rm", image, "id"}, timeout_);
  if (!ran) {
    return IdentityResult::Error(ran.error());
  }

  auto output = boost::algorithm::trim_copy(ran.value().output);
  if (ran.value().exit_code != 0) {
    return IdentityResult::Error(command_failed(
        fmt::format("'{} run --rm {} id' exited with {}: {}", *cli, image,
                    ran.value().exit_code, output.substr(0, 200))));
  }

  spdlog::debug("Identity probe output for {}: {}", image, output);
  return parse_identity(output);
}

} // namespace dbdock::host
