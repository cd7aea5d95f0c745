#include "handlers.hpp"

#include "validate.hpp"

#include <algorithm>
#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dbdock::api {

namespace {

using utils::HttpError;
using utils::HttpResult;
using utils::make_http_error;
namespace http = utils::http;

constexpr const char *kServiceName = "Database Manager - Docker/Podman Proxy";
constexpr const char *kServiceVersion = "1.0.0";

HttpResult fail(HttpError error) { return HttpResult::Error(std::move(error)); }

HttpResult fail(int status, std::string message) {
  return fail(make_http_error(status, std::move(message)));
}

Json::Value records_to_json(const std::vector<runtime::ContainerRecord> &list) {
  Json::Value out(Json::arrayValue);
  for (const auto &record : list) {
    out.append(utils::to_json_value(runtime::to_json(record)));
  }
  return out;
}

std::string string_field(const nlohmann::json &node, const char *key) {
  auto it = node.find(key);
  if (it != node.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

Json::Value identity_json(const host::ImageIdentity &identity) {
  Json::Value out;
  out["uid"] = identity.uid;
  out["gid"] = identity.gid;
  out["user"] = identity.user;
  return out;
}

core::Result<deploy::DeploymentRequest, HttpError>
to_request(validate::DeployBody body) {
  using Converted = core::Result<deploy::DeploymentRequest, HttpError>;

  auto engine = deploy::parse_engine(body.type);
  if (!engine) {
    return Converted::Error(make_http_error(
        http::BadRequest,
        fmt::format("Unsupported database type: {}", body.type)));
  }

  deploy::DeploymentRequest request;
  request.engine = *engine;
  request.name = std::move(body.name);
  request.version = std::move(body.version);
  request.root_password = std::move(body.root_password);
  request.database = std::move(body.database);
  request.username = std::move(body.username);
  request.password = std::move(body.password);
  request.port = body.port;
  request.persistent_storage = body.persistent_storage.value_or(false);
  request.storage_path = std::move(body.storage_path);
  if (body.environment) {
    for (auto &[key, value] : *body.environment) {
      request.environment.emplace_back(key, std::move(value));
    }
  }
  return Converted::Ok(std::move(request));
}

Json::Value outcome_json(const deploy::DeploymentOutcome &outcome) {
  Json::Value out;
  out["container_id"] = outcome.container_id;
  out["container_name"] = outcome.container_name;
  out["image"] = outcome.image;
  out["identity"] = identity_json(outcome.identity);
  out["identity_source"] =
      std::string(deploy::to_string(outcome.identity_source));
  out["stage"] = std::string(deploy::to_string(outcome.final_stage));
  Json::Value warnings(Json::arrayValue);
  for (const auto &warning : outcome.warnings) {
    warnings.append(warning);
  }
  out["warnings"] = warnings;
  return out;
}

std::string created_message(const std::string &name,
                            const std::vector<std::string> &operations) {
  if (operations.empty()) {
    return fmt::format("Directory '{}' created successfully", name);
  }
  return fmt::format("Directory '{}' created successfully with {}", name,
                     boost::algorithm::join(operations, " and "));
}

} // namespace

HttpError to_http_error(const runtime::GatewayError &error) {
  using Kind = runtime::GatewayErrorKind;
  int status = http::BadGateway;
  switch (error.kind()) {
  case Kind::Transport:
    status = http::ServiceUnavailable;
    break;
  case Kind::Timeout:
    status = http::GatewayTimeout;
    break;
  case Kind::Decode:
    status = http::BadGateway;
    break;
  case Kind::Dialect:
    status = http::BadRequest;
    break;
  case Kind::Runtime:
    // Client errors (no such container, name conflict) keep their status.
    status = error.status_code() >= 400 && error.status_code() < 500
                 ? error.status_code()
                 : http::BadGateway;
    break;
  }

  auto out = make_http_error(status, error.message());
  out.details["kind"] = std::string(to_string(error.kind()));
  if (error.status_code() != 0) {
    out.details["runtime_status"] = error.status_code();
  }
  return out;
}

HttpError to_http_error(const host::FilesystemError &error) {
  using Kind = host::FilesystemErrorKind;
  int status = http::InternalServerError;
  switch (error.kind()) {
  case Kind::InvalidPath:
  case Kind::InvalidName:
  case Kind::InvalidMode:
  case Kind::NotADirectory:
    status = http::BadRequest;
    break;
  case Kind::NotFound:
    status = http::NotFound;
    break;
  case Kind::AlreadyExists:
    status = http::Conflict;
    break;
  case Kind::Io:
    status = http::InternalServerError;
    break;
  }
  return make_http_error(status, error.message());
}

HttpError to_http_error(const host::IdentityError &error) {
  auto status = error.is(host::IdentityErrorKind::CliUnavailable)
                    ? http::ServiceUnavailable
                    : http::InternalServerError;
  auto out = make_http_error(status, error.message());
  out.details["kind"] = std::string(to_string(error.kind()));
  return out;
}

HttpError to_http_error(const deploy::OrchestrationError &error) {
  if (error.stage() == deploy::FailedStep::Validate) {
    return make_http_error(http::BadRequest, error.message());
  }

  auto out = make_http_error(http::BadGateway, error.message());
  out.details["stage"] = std::string(deploy::to_string(error.stage()));
  if (!error.container_id().empty()) {
    out.details["container_id"] = error.container_id();
  }
  if (error.cause_status() != 0) {
    out.details["runtime_status"] = error.cause_status();
  }
  if (error.retryable_start()) {
    out.details["retryable_action"] = "start";
  }
  return out;
}

HttpError to_http_error(const deploy::ValidationError &error) {
  auto out = make_http_error(http::BadRequest, error.message());
  Json::Value fields(Json::arrayValue);
  for (const auto &field : error.errors()) {
    Json::Value entry;
    entry["field"] = field.field;
    entry["message"] = field.message;
    fields.append(entry);
  }
  out.details["fields"] = fields;
  return out;
}

std::optional<std::string> resolve_cors_origin(const config::CorsConfig &cors,
                                               const std::string &origin) {
  if (!cors.enabled) {
    return std::nullopt;
  }
  const auto &allowed = cors.origins;
  if (allowed.empty() ||
      std::find(allowed.begin(), allowed.end(), "*") != allowed.end()) {
    return std::string("*");
  }
  if (!origin.empty() &&
      std::find(allowed.begin(), allowed.end(), origin) != allowed.end()) {
    return origin;
  }
  return std::nullopt;
}

std::optional<std::string> passthrough_path(std::string_view resource) {
  constexpr std::string_view prefix = "/api/podman";
  if (resource.substr(0, prefix.size()) != prefix) {
    return std::nullopt;
  }
  std::string_view rest = resource.substr(prefix.size());
  if (rest.empty()) {
    return std::string("/");
  }
  if (rest.front() != '/') {
    return std::nullopt;
  }
  return std::string(rest);
}

ApiHandlers::ApiHandlers(std::shared_ptr<runtime::RuntimeGateway> gateway,
                         std::shared_ptr<deploy::Orchestrator> orchestrator,
                         std::shared_ptr<host::IFilesystem> filesystem,
                         std::shared_ptr<host::IIdentityProbe> identity_probe)
    : gateway_(std::move(gateway)), orchestrator_(std::move(orchestrator)),
      filesystem_(std::move(filesystem)),
      identity_probe_(std::move(identity_probe)) {}

HttpResult ApiHandlers::health() const {
  const auto &endpoint = gateway_->endpoint();
  auto info = gateway_->info();
  if (!info) {
    // Not the usual envelope: callers poll for status == "unhealthy".
    auto error = make_http_error(http::ServiceUnavailable,
                                 info.error().serialize());
    error.details["status"] = "unhealthy";
    error.details["socketPath"] = endpoint.socket_path();
    return fail(std::move(error));
  }

  const auto &body = info.value();
  std::string version = "unknown";
  std::string api_version =
      endpoint.dialect() == runtime::Dialect::Docker ? "1.41" : "unknown";
  if (auto it = body.find("version"); it != body.end() && it->is_object()) {
    if (auto v = string_field(*it, "Version"); !v.empty()) {
      version = v;
    }
    if (auto v = string_field(*it, "APIVersion"); !v.empty()) {
      api_version = v;
    }
  }
  if (auto v = string_field(body, "ServerVersion"); !v.empty()) {
    version = v;
  }

  Json::Value out;
  out["status"] = "healthy";
  out["docker"]["version"] = version;
  out["docker"]["apiVersion"] = api_version;
  out["docker"]["socketPath"] = endpoint.socket_path();
  out["docker"]["dialect"] = std::string(to_string(endpoint.dialect()));
  return HttpResult::Ok(std::move(out));
}

HttpResult ApiHandlers::describe() const {
  Json::Value endpoints;
  endpoints["health"] = "/health";
  endpoints["runtimeInfo"] = "/api/info";
  endpoints["containers"] = "/api/containers";
  endpoints["deployments"] = "/api/deployments";
  endpoints["filesystem"] = "/api/filesystem?path=/path/to/browse";
  endpoints["userInfo"] = "/api/container/user-info";
  endpoints["dockerProxy"] = "/api/podman/*";

  Json::Value out;
  out["service"] = kServiceName;
  out["version"] = kServiceVersion;
  out["endpoints"] = endpoints;
  out["socketPath"] = gateway_->endpoint().socket_path();
  out["dialect"] = std::string(to_string(gateway_->dialect()));
  return HttpResult::Ok(std::move(out));
}

HttpResult ApiHandlers::runtime_info() const {
  auto info = gateway_->info();
  if (!info) {
    return fail(to_http_error(info.error()));
  }
  return HttpResult::Ok(
      utils::create_success_response(utils::to_json_value(info.value())));
}

HttpResult ApiHandlers::list_containers(bool all, bool managed_only) const {
  auto listed = gateway_->list_containers(all);
  if (!listed) {
    return fail(to_http_error(listed.error()));
  }

  auto records = std::move(listed).value();
  if (managed_only) {
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [](const runtime::ContainerRecord &record) {
                                   return !runtime::is_managed(record);
                                 }),
                  records.end());
  }

  return HttpResult::Ok(utils::create_success_response(
      {"containers", "count"}, records_to_json(records),
      static_cast<int>(records.size())));
}

HttpResult ApiHandlers::inspect_container(const std::string &id) const {
  auto inspected = gateway_->inspect_container(id);
  if (!inspected) {
    return fail(to_http_error(inspected.error()));
  }
  return HttpResult::Ok(utils::create_success_response(
      utils::to_json_value(runtime::to_json(inspected.value()))));
}

HttpResult ApiHandlers::container_action(runtime::Operation op,
                                         const std::string &id) const {
  runtime::GatewayStatus status = runtime::GatewayStatus::Error(
      runtime::GatewayError::dialect("unsupported container action"));
  const char *action = "";
  switch (op) {
  case runtime::Operation::StartContainer:
    action = "start";
    status = gateway_->start_container(id);
    break;
  case runtime::Operation::StopContainer:
    action = "stop";
    status = gateway_->stop_container(id);
    break;
  case runtime::Operation::RestartContainer:
    action = "restart";
    status = gateway_->restart_container(id);
    break;
  default:
    break;
  }

  if (!status) {
    return fail(to_http_error(status.error()));
  }
  spdlog::info("Container {}: {}", id, action);
  return HttpResult::Ok(
      utils::create_success_response({"id", "action"}, id, action));
}

HttpResult ApiHandlers::remove_container(const std::string &id,
                                         bool force) const {
  auto removed = gateway_->remove_container(id, force);
  if (!removed) {
    return fail(to_http_error(removed.error()));
  }
  spdlog::info("Container {} removed", id);
  return HttpResult::Ok(
      utils::create_success_response({"id", "removed"}, id, true));
}

HttpResult ApiHandlers::container_logs(const std::string &id, int tail) const {
  auto logs = gateway_->container_logs(id, tail);
  if (!logs) {
    return fail(to_http_error(logs.error()));
  }

  const auto &lines = logs.value();
  Json::Value array(Json::arrayValue);
  for (const auto &line : lines) {
    array.append(line);
  }
  return HttpResult::Ok(utils::create_success_response(
      {"id", "logs", "lines"}, id, boost::algorithm::join(lines, "\n"),
      array));
}

HttpResult ApiHandlers::container_stats(const std::string &id) const {
  auto stats = gateway_->container_stats(id);
  if (!stats) {
    return fail(to_http_error(stats.error()));
  }
  return HttpResult::Ok(utils::create_success_response(
      utils::to_json_value(runtime::to_json(stats.value()))));
}

HttpResult ApiHandlers::deploy(const Json::Value &body) const {
  auto parsed = validate::Validator::validate<validate::DeployBody>(body);
  if (!parsed) {
    return fail(http::BadRequest, parsed.error());
  }

  auto request = to_request(std::move(parsed).value());
  if (!request) {
    return fail(request.error());
  }
  if (auto valid = deploy::validate(request.value()); !valid) {
    return fail(to_http_error(valid.error()));
  }

  auto deployed = orchestrator_->deploy(request.value());
  if (!deployed) {
    return fail(to_http_error(deployed.error()));
  }
  return HttpResult::Ok(
      utils::create_success_response(outcome_json(deployed.value())));
}

HttpResult ApiHandlers::list_directories(const std::string &path) const {
  auto listing = filesystem_->list_directories(path.empty() ? "/" : path);
  if (!listing) {
    return fail(to_http_error(listing.error()));
  }

  const auto &value = listing.value();
  Json::Value directories(Json::arrayValue);
  for (const auto &entry : value.directories) {
    Json::Value item;
    item["name"] = entry.name;
    item["path"] = entry.path;
    directories.append(item);
  }

  Json::Value data;
  data["current_path"] = value.current_path;
  data["parent_path"] =
      value.parent_path ? Json::Value(*value.parent_path) : Json::Value();
  data["directories"] = directories;
  return HttpResult::Ok(utils::create_success_response(std::move(data)));
}

HttpResult ApiHandlers::stat_path(const std::string &path) const {
  auto info = filesystem_->stat(path.empty() ? "/" : path);
  if (!info) {
    return fail(to_http_error(info.error()));
  }

  const auto &value = info.value();
  if (!value.exists) {
    return fail(http::NotFound, "Path not found");
  }

  Json::Value data;
  data["exists"] = true;
  data["is_directory"] = value.is_directory;
  data["is_file"] = value.is_file;
  data["path"] = value.path;
  data["size"] = static_cast<Json::UInt64>(value.size);
  data["modified"] = static_cast<Json::Int64>(value.modified);
  data["permissions"] = value.mode;
  return HttpResult::Ok(utils::create_success_response(std::move(data)));
}

HttpResult ApiHandlers::make_directory(const Json::Value &body) const {
  auto parsed = validate::Validator::validate<validate::MkdirBody>(body);
  if (!parsed) {
    return fail(http::BadRequest, parsed.error());
  }

  auto params = std::move(parsed).value();
  if (params.path.empty() || params.name.empty()) {
    return fail(http::BadRequest, "Path and name are required");
  }

  host::MakeDirectoryOptions options{params.mode, params.owner, params.group};
  auto created = filesystem_->make_directory(params.path, params.name, options);
  if (!created) {
    return fail(to_http_error(created.error()));
  }

  const auto &value = created.value();
  Json::Value operations(Json::arrayValue);
  for (const auto &operation : value.operations) {
    operations.append(operation);
  }
  Json::Value warnings(Json::arrayValue);
  for (const auto &warning : value.warnings) {
    warnings.append(warning);
  }
  return HttpResult::Ok(utils::create_success_response(
      {"path", "message", "operations", "warnings"}, value.path,
      created_message(params.name, value.operations), operations, warnings));
}

HttpResult ApiHandlers::user_info(const Json::Value &body) const {
  auto parsed = validate::Validator::validate<validate::UserInfoBody>(body);
  if (!parsed) {
    return fail(http::BadRequest, parsed.error());
  }
  const auto &image = parsed.value().image;
  if (image.empty()) {
    return fail(http::BadRequest, "Image name is required");
  }

  spdlog::info("Getting user info for image: {}", image);
  auto identity = identity_probe_->probe(image);
  if (!identity) {
    return fail(to_http_error(identity.error()));
  }
  return HttpResult::Ok(
      utils::create_success_response(identity_json(identity.value())));
}

ForwardResult ApiHandlers::forward(const std::string &method,
                                   const std::string &api_path,
                                   const std::string &raw_query,
                                   const std::string &body) const {
  auto forwarded = gateway_->forward(method, api_path, raw_query, body);
  if (!forwarded) {
    return ForwardResult::Error(to_http_error(forwarded.error()));
  }

  const auto &result = forwarded.value();
  ForwardedReply reply;
  reply.status = result.status_code;
  if (const auto *parsed = result.json()) {
    reply.content_type = "application/json";
    reply.body = parsed->dump();
  } else if (std::holds_alternative<runtime::LogLines>(result.payload)) {
    reply.content_type = "text/plain";
    reply.body = result.text();
  } else {
    auto it = result.headers.find("content-type");
    reply.content_type =
        it != result.headers.end() ? it->second : std::string("text/plain");
    reply.body = result.text();
  }
  return ForwardResult::Ok(std::move(reply));
}

} // namespace dbdock::api
