#ifndef DBDOCK_CONFIG_CONFIG_HPP
#define DBDOCK_CONFIG_CONFIG_HPP

#include <infrastructure/result.hpp>

#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace dbdock::config {

struct CorsConfig {
  bool enabled = true;
  std::vector<std::string> origins{"*"};
};

struct ServerSection {
  std::string host = "127.0.0.1";
  int port = 3000;
  unsigned threads = 0; // 0: hardware concurrency
  CorsConfig cors;
};

struct SocketSection {
  bool auto_detect = true;
  std::string path; // explicit socket, wins over auto-detection
  std::vector<std::string> candidates;
};

struct StorageSection {
  std::string default_mode = "755";
  std::string default_base_path;
};

struct LoggingSection {
  bool enabled = true;
  std::string log_file = "dbdock.log";
  std::string log_level = "info";
  bool console_output = true;
};

struct ServerConfig {
  ServerSection server;
  SocketSection socket;
  StorageSection storage;
  LoggingSection logging;
  // engine name -> image repository
  std::map<std::string, std::string> template_repositories;
};

using ConfigResult = core::Result<ServerConfig, std::string>;
using EnvLookup = std::function<std::optional<std::string>(const char *)>;

ConfigResult parse_config(const nlohmann::json &document);
ConfigResult parse_config_text(const std::string &text);

// A missing file yields the defaults; an unreadable or malformed one is an
// error.
ConfigResult load_config(const std::string &path);

// DOCKER_SOCKET / PODMAN_SOCKET, HOST, PORT.
void apply_env_overrides(ServerConfig &config, const EnvLookup &lookup);
void apply_env_overrides(ServerConfig &config);

// Explicit path alone when set, otherwise the configured or built-in
// discovery list.
std::vector<std::string> socket_candidates(const ServerConfig &config);

// Installs the console and file sinks described by the logging section as
// the default spdlog logger.
void setup_logging(const LoggingSection &logging);

} // namespace dbdock::config

#endif // DBDOCK_CONFIG_CONFIG_HPP
