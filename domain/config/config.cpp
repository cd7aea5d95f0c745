#include "config.hpp"

#include <runtime/endpoint.hpp>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <system_error>

namespace dbdock::config {

namespace {

using json = nlohmann::json;

const json *section(const json &document, const char *key) {
  auto it = document.find(key);
  if (it == document.end() || !it->is_object()) {
    return nullptr;
  }
  return &*it;
}

void read_server(const json &node, ServerSection &server) {
  server.host = node.value("host", server.host);
  server.port = node.value("port", server.port);
  server.threads = node.value("threads", server.threads);
  if (const auto *cors = section(node, "cors")) {
    server.cors.enabled = cors->value("enabled", server.cors.enabled);
    server.cors.origins = cors->value("origins", server.cors.origins);
  }
}

void read_socket(const json &node, SocketSection &socket) {
  socket.auto_detect = node.value("autoDetect", socket.auto_detect);
  socket.path = node.value("path", socket.path);
  socket.candidates = node.value("candidates", socket.candidates);
}

void read_storage(const json &node, StorageSection &storage) {
  if (const auto *permissions = section(node, "defaultPermissions")) {
    storage.default_mode = permissions->value("mode", storage.default_mode);
  }
  storage.default_base_path =
      node.value("defaultBasePath", storage.default_base_path);
}

void read_logging(const json &node, LoggingSection &logging) {
  logging.enabled = node.value("enabled", logging.enabled);
  logging.log_file = node.value("logFile", logging.log_file);
  logging.log_level = node.value("logLevel", logging.log_level);
  logging.console_output = node.value("consoleOutput", logging.console_output);
}

// "templates": {"mariadb": {"image": "..."}} or {"mariadb": "..."}
void read_templates(const json &node,
                    std::map<std::string, std::string> &repositories) {
  for (const auto &[engine, entry] : node.items()) {
    if (entry.is_string()) {
      repositories[engine] = entry.get<std::string>();
    } else if (entry.is_object()) {
      auto image = entry.value("image", std::string{});
      if (!image.empty()) {
        repositories[engine] = image;
      }
    }
  }
}

std::optional<std::string> process_env(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

ConfigResult parse_config(const json &document) {
  ServerConfig config;
  if (document.is_null()) {
    return ConfigResult::Ok(std::move(config));
  }
  if (!document.is_object()) {
    return ConfigResult::Error("configuration root must be a JSON object");
  }

  try {
    if (const auto *node = section(document, "server")) {
      read_server(*node, config.server);
    }
    if (const auto *node = section(document, "containerSocket")) {
      read_socket(*node, config.socket);
    }
    if (const auto *node = section(document, "storage")) {
      read_storage(*node, config.storage);
    }
    if (const auto *node = section(document, "logging")) {
      read_logging(*node, config.logging);
    }
    if (const auto *node = section(document, "templates")) {
      read_templates(*node, config.template_repositories);
    }
  } catch (const json::exception &e) {
    return ConfigResult::Error(
        fmt::format("invalid configuration value: {}", e.what()));
  }

  if (config.server.port <= 0 || config.server.port > 65535) {
    return ConfigResult::Error(
        fmt::format("server.port out of range: {}", config.server.port));
  }
  return ConfigResult::Ok(std::move(config));
}

ConfigResult parse_config_text(const std::string &text) {
  auto document = json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    return ConfigResult::Error("configuration is not valid JSON");
  }
  return parse_config(document);
}

ConfigResult load_config(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::info("No configuration at {}, using defaults", path);
    return ConfigResult::Ok(ServerConfig{});
  }

  std::ifstream input(path);
  if (!input) {
    return ConfigResult::Error(fmt::format("cannot read {}", path));
  }
  std::stringstream buffer;
  buffer << input.rdbuf();

  return parse_config_text(buffer.str()).map_error([&path](const std::string &e) {
    return fmt::format("{}: {}", path, e);
  });
}

void apply_env_overrides(ServerConfig &config, const EnvLookup &lookup) {
  if (auto socket = lookup("DOCKER_SOCKET")) {
    config.socket.path = *socket;
  } else if (auto podman = lookup("PODMAN_SOCKET")) {
    config.socket.path = *podman;
  }

  if (auto host = lookup("HOST")) {
    config.server.host = *host;
  }

  if (auto port = lookup("PORT")) {
    int value = 0;
    auto [ptr, ec] =
        std::from_chars(port->data(), port->data() + port->size(), value);
    if (ec == std::errc{} && ptr == port->data() + port->size() && value > 0 &&
        value <= 65535) {
      config.server.port = value;
    } else {
      spdlog::warn("Ignoring PORT={}, not a valid port", *port);
    }
  }
}

void apply_env_overrides(ServerConfig &config) {
  apply_env_overrides(config, process_env);
}

std::vector<std::string> socket_candidates(const ServerConfig &config) {
  if (!config.socket.path.empty()) {
    return {config.socket.path};
  }
  if (!config.socket.auto_detect) {
    return {};
  }
  if (!config.socket.candidates.empty()) {
    return config.socket.candidates;
  }
  return runtime::default_socket_candidates();
}

void setup_logging(const LoggingSection &logging) {
  std::vector<spdlog::sink_ptr> sinks;
  if (logging.console_output) {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }

  std::string file_error;
  if (logging.enabled && !logging.log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
          logging.log_file));
    } catch (const spdlog::spdlog_ex &e) {
      file_error = e.what();
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("dbdock", sinks.begin(), sinks.end());
  // Disabled logging still reports errors.
  auto level = logging.enabled ? spdlog::level::from_str(logging.log_level)
                               : spdlog::level::err;
  if (level == spdlog::level::off && logging.log_level != "off") {
    level = spdlog::level::info;
  }
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Log file {} unavailable: {}", logging.log_file, file_error);
  } else if (logging.enabled && !logging.log_file.empty()) {
    spdlog::info("Logging to {}", logging.log_file);
  }
}

} // namespace dbdock::config
