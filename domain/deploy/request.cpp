#include "request.hpp"

#include <runtime/container_record.hpp>

#include <boost/regex.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace dbdock::deploy {

namespace {

constexpr size_t kMaxNameLength = 50;
constexpr int kMinPort = 1024;
constexpr int kMaxPort = 65535;

const boost::regex &name_pattern() {
  static const boost::regex pattern("^[a-zA-Z][a-zA-Z0-9_-]*$");
  return pattern;
}

const boost::regex &env_key_pattern() {
  static const boost::regex pattern("^[A-Za-z_][A-Za-z0-9_]*$");
  return pattern;
}

} // namespace

std::string ValidationError::message() const {
  std::string out;
  for (const auto &error : errors_) {
    if (!out.empty()) {
      out += "; ";
    }
    out += fmt::format("{}: {}", error.field, error.message);
  }
  return out;
}

core::Status<ValidationError> validate(const DeploymentRequest &request) {
  ValidationError errors;

  if (request.name.empty()) {
    errors.add("name", "Database name is required");
  } else if (!boost::regex_match(request.name, name_pattern())) {
    errors.add("name", "Database name must start with a letter and contain "
                       "only letters, numbers, hyphens, and underscores");
  } else if (request.name.size() > kMaxNameLength) {
    errors.add("name", "Database name must be 50 characters or less");
  }

  if (request.port < kMinPort || request.port > kMaxPort) {
    errors.add("port", "Port must be between 1024 and 65535");
  }
  if (request.version.empty()) {
    errors.add("version", "Version is required");
  }
  if (request.root_password.empty()) {
    errors.add("root_password", "Root password is required");
  }

  if (request.persistent_storage) {
    if (!request.storage_path || request.storage_path->empty()) {
      errors.add("storage_path",
                 "Storage path is required when persistent storage is on");
    } else if (request.storage_path->front() != '/') {
      errors.add("storage_path", "Storage path must be absolute");
    } else if (request.storage_path->find(':') != std::string::npos) {
      errors.add("storage_path", "Storage path must not contain ':'");
    } else if (normalized_storage_path(*request.storage_path) == "/") {
      errors.add("storage_path", "Storage path must not be the root directory");
    }
  }

  for (const auto &[key, value] : request.environment) {
    if (!boost::regex_match(key, env_key_pattern())) {
      errors.add("environment",
                 fmt::format("Invalid environment variable name '{}'", key));
    }
  }

  if (!errors.empty()) {
    return core::Status<ValidationError>::Error(std::move(errors));
  }
  return core::ok_status<ValidationError>();
}

std::string normalized_storage_path(const std::string &path) {
  auto normal = std::filesystem::path(path).lexically_normal().string();
  while (normal.size() > 1 && normal.back() == '/') {
    normal.pop_back();
  }
  return normal;
}

std::string container_name(const DeploymentRequest &request) {
  return fmt::format("db-{}-{}", to_string(request.engine), request.name);
}

std::string image_reference(const DeploymentRequest &request,
                            const EngineTemplate &tmpl) {
  return fmt::format("{}:{}", tmpl.image_repository, request.version);
}

std::vector<std::string> environment_for(const DeploymentRequest &request,
                                         const EngineTemplate &tmpl) {
  std::vector<std::string> env;
  env.push_back(
      fmt::format("{}={}", tmpl.root_password_env, request.root_password));
  if (request.database && !request.database->empty()) {
    env.push_back(fmt::format("{}={}", tmpl.database_env, *request.database));
  }
  if (request.username && !request.username->empty()) {
    env.push_back(fmt::format("{}={}", tmpl.user_env, *request.username));
  }
  if (tmpl.user_password_env && request.password &&
      !request.password->empty()) {
    env.push_back(
        fmt::format("{}={}", *tmpl.user_password_env, *request.password));
  }
  for (const auto &[key, value] : request.environment) {
    env.push_back(fmt::format("{}={}", key, value));
  }
  return env;
}

runtime::ContainerSpec build_container_spec(const DeploymentRequest &request,
                                            const EngineTemplate &tmpl) {
  namespace labels = runtime::labels;

  runtime::ContainerSpec spec;
  spec.name = container_name(request);
  spec.image = image_reference(request, tmpl);
  spec.env = environment_for(request, tmpl);
  spec.port_bindings.emplace(fmt::format("{}/tcp", tmpl.container_port),
                             std::to_string(request.port));
  if (request.wants_storage()) {
    spec.binds.push_back(
        fmt::format("{}:{}", normalized_storage_path(*request.storage_path),
                    tmpl.data_dir));
  }
  spec.labels = {
      {std::string(labels::kDatabaseType), std::string(to_string(request.engine))},
      {std::string(labels::kDatabaseName), request.name},
      {std::string(labels::kDatabasePort), std::to_string(request.port)},
      {std::string(labels::kManaged), std::string(labels::kManagedMarker)},
  };
  return spec;
}

} // namespace dbdock::deploy
