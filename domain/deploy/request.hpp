#ifndef DBDOCK_DEPLOY_REQUEST_HPP
#define DBDOCK_DEPLOY_REQUEST_HPP

#include "engine.hpp"

#include <infrastructure/result.hpp>
#include <runtime/dialect.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbdock::deploy {

struct DeploymentRequest {
  Engine engine = Engine::MariaDb;
  std::string name;
  std::string version;
  std::string root_password;
  std::optional<std::string> database;
  std::optional<std::string> username;
  std::optional<std::string> password;
  int port = 0;
  bool persistent_storage = false;
  std::optional<std::string> storage_path;
  std::vector<std::pair<std::string, std::string>> environment;

  bool wants_storage() const {
    return persistent_storage && storage_path && !storage_path->empty();
  }
};

struct FieldError {
  std::string field;
  std::string message;
};

class ValidationError {
public:
  void add(std::string field, std::string message) {
    errors_.push_back({std::move(field), std::move(message)});
  }

  bool empty() const { return errors_.empty(); }
  const std::vector<FieldError> &errors() const { return errors_; }

  // "field: message; field: message"
  std::string message() const;

private:
  std::vector<FieldError> errors_;
};

core::Status<ValidationError> validate(const DeploymentRequest &request);

// Lexically normalized absolute path without a trailing separator. Used for
// both the storage directory checks and the bind mount source.
std::string normalized_storage_path(const std::string &path);

// db-<engine>-<name>
std::string container_name(const DeploymentRequest &request);

std::string image_reference(const DeploymentRequest &request,
                            const EngineTemplate &tmpl);

std::vector<std::string> environment_for(const DeploymentRequest &request,
                                         const EngineTemplate &tmpl);

runtime::ContainerSpec build_container_spec(const DeploymentRequest &request,
                                            const EngineTemplate &tmpl);

} // namespace dbdock::deploy

#endif // DBDOCK_DEPLOY_REQUEST_HPP
