#ifndef DBDOCK_API_HANDLERS_HPP
#define DBDOCK_API_HANDLERS_HPP

#include <config/config.hpp>
#include <deploy/orchestrator.hpp>
#include <host/filesystem.hpp>
#include <host/identity_probe.hpp>
#include <runtime/gateway.hpp>
#include <utils/http_helpers.hpp>

#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace dbdock::api {

// Runtime response relayed as-is by the /api/podman/* bridge.
struct ForwardedReply {
  int status = 200;
  std::string content_type;
  std::string body;
};

using ForwardResult = core::Result<ForwardedReply, utils::HttpError>;

utils::HttpError to_http_error(const runtime::GatewayError &error);
utils::HttpError to_http_error(const host::FilesystemError &error);
utils::HttpError to_http_error(const host::IdentityError &error);
utils::HttpError to_http_error(const deploy::OrchestrationError &error);
utils::HttpError to_http_error(const deploy::ValidationError &error);

// Value for Access-Control-Allow-Origin, or nothing when the origin is not
// allowed (or CORS is off).
std::optional<std::string> resolve_cors_origin(const config::CorsConfig &cors,
                                               const std::string &origin);

// Runtime API path behind the /api/podman bridge: "/api/podman" maps to "/"
// and "/api/podman/<rest>" to "/<rest>". Any other resource is not bridged.
std::optional<std::string> passthrough_path(std::string_view resource);

// Transport-independent request handling. Every method returns either the
// response body for the success status or the error to report.
class ApiHandlers {
public:
  ApiHandlers(std::shared_ptr<runtime::RuntimeGateway> gateway,
              std::shared_ptr<deploy::Orchestrator> orchestrator,
              std::shared_ptr<host::IFilesystem> filesystem,
              std::shared_ptr<host::IIdentityProbe> identity_probe);

  utils::HttpResult health() const;
  utils::HttpResult describe() const;
  utils::HttpResult runtime_info() const;

  utils::HttpResult list_containers(bool all, bool managed_only) const;
  utils::HttpResult inspect_container(const std::string &id) const;
  // StartContainer, StopContainer or RestartContainer.
  utils::HttpResult container_action(runtime::Operation op,
                                     const std::string &id) const;
  utils::HttpResult remove_container(const std::string &id, bool force) const;
  utils::HttpResult container_logs(const std::string &id, int tail) const;
  utils::HttpResult container_stats(const std::string &id) const;

  utils::HttpResult deploy(const Json::Value &body) const;

  utils::HttpResult list_directories(const std::string &path) const;
  utils::HttpResult stat_path(const std::string &path) const;
  utils::HttpResult make_directory(const Json::Value &body) const;
  utils::HttpResult user_info(const Json::Value &body) const;

  ForwardResult forward(const std::string &method, const std::string &api_path,
                        const std::string &raw_query,
                        const std::string &body) const;

private:
  std::shared_ptr<runtime::RuntimeGateway> gateway_;
  std::shared_ptr<deploy::Orchestrator> orchestrator_;
  std::shared_ptr<host::IFilesystem> filesystem_;
  std::shared_ptr<host::IIdentityProbe> identity_probe_;
};

} // namespace dbdock::api

#endif // DBDOCK_API_HANDLERS_HPP
