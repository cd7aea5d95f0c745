#include "dialect.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <iterator>

namespace dbdock::runtime {

namespace {

using json = nlohmann::json;

constexpr std::string_view kDockerPrefix = "/v1.41";
constexpr std::string_view kPodmanPrefix = "/v4.0.0/libpod";

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string bool_param(bool value) { return value ? "true" : "false"; }

json common_create_body(const ContainerSpec &spec) {
  json body;
  body["Image"] = spec.image;
  body["Env"] = spec.env;

  json exposed = json::object();
  json bindings = json::object();
  for (const auto &[container_port, host_port] : spec.port_bindings) {
    exposed[container_port] = json::object();
    bindings[container_port] = json::array({{{"HostPort", host_port}}});
  }
  body["ExposedPorts"] = exposed;

  json host_config;
  host_config["PortBindings"] = bindings;
  if (!spec.binds.empty()) {
    host_config["Binds"] = spec.binds;
  }
  body["HostConfig"] = host_config;
  body["Labels"] = spec.labels;
  return body;
}

std::vector<std::string> string_array(const json &value) {
  std::vector<std::string> out;
  if (!value.is_array()) {
    return out;
  }
  for (const auto &item : value) {
    if (item.is_string()) {
      out.push_back(item.get<std::string>());
    }
  }
  return out;
}

std::string string_field(const json &obj, const char *primary,
                         const char *fallback) {
  for (auto key : {primary, fallback}) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
      return it->get<std::string>();
    }
  }
  return {};
}

const json *array_field(const json &obj, const char *primary,
                        const char *fallback) {
  for (auto key : {primary, fallback}) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_array()) {
      return &*it;
    }
  }
  return nullptr;
}

GatewayResult<RequestPlan> missing(Operation op, std::string_view what) {
  return GatewayResult<RequestPlan>::Error(GatewayError::dialect(
      fmt::format("{} requires a {}", to_string(op), what)));
}

} // namespace

std::string_view to_string(Operation op) {
  switch (op) {
  case Operation::RuntimeInfo:
    return "info";
  case Operation::ListContainers:
    return "list-containers";
  case Operation::InspectContainer:
    return "inspect-container";
  case Operation::CreateContainer:
    return "create-container";
  case Operation::StartContainer:
    return "start-container";
  case Operation::StopContainer:
    return "stop-container";
  case Operation::RestartContainer:
    return "restart-container";
  case Operation::RemoveContainer:
    return "remove-container";
  case Operation::PullImage:
    return "pull-image";
  case Operation::ContainerLogs:
    return "container-logs";
  case Operation::ContainerStats:
    return "container-stats";
  }
  return "unknown";
}

std::string url_encode(std::string_view input) {
  std::string result;
  result.reserve(input.size() * 3);
  for (char c : input) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.' || c == '~') {
      result += c;
    } else {
      fmt::format_to(std::back_inserter(result), "%{:02X}",
                     static_cast<unsigned char>(c));
    }
  }
  return result;
}

std::string RequestPlan::target() const {
  if (query.empty()) {
    return path;
  }
  std::string out = path;
  char sep = path.find('?') == std::string::npos ? '?' : '&';
  for (const auto &[key, value] : query) {
    out += sep;
    out += url_encode(key);
    out += '=';
    out += url_encode(value);
    sep = '&';
  }
  return out;
}

CreateShape shape_create_request(Dialect dialect, const ContainerSpec &spec) {
  auto body = common_create_body(spec);
  if (dialect == Dialect::Docker) {
    return DockerCreateShape{spec.name, std::move(body)};
  }
  if (!spec.name.empty()) {
    body["Name"] = spec.name;
  }
  return PodmanCreateShape{std::move(body)};
}

std::string_view DialectTranslator::prefix() const {
  return dialect_ == Dialect::Docker ? kDockerPrefix : kPodmanPrefix;
}

GatewayResult<RequestPlan>
DialectTranslator::translate(Operation op,
                             const OperationParams &params) const {
  using Out = GatewayResult<RequestPlan>;
  const std::string base(prefix());

  auto container_path = [&](std::string_view suffix) {
    return fmt::format("{}/containers/{}{}", base,
                       url_encode(params.container_id), suffix);
  };

  switch (op) {
  case Operation::RuntimeInfo:
    return Out::Ok(RequestPlan{op, "GET", base + "/info", {}, {}});

  case Operation::ListContainers:
    return Out::Ok(RequestPlan{op,
                               "GET",
                               base + "/containers/json",
                               {{"all", bool_param(params.all)}},
                               {}});

  case Operation::CreateContainer:
    return plan_create(params);

  case Operation::PullImage:
    if (params.image.empty()) {
      return missing(op, "image reference");
    }
    if (dialect_ == Dialect::Docker) {
      return Out::Ok(RequestPlan{op,
                                 "POST",
                                 base + "/images/create",
                                 {{"fromImage", params.image}},
                                 {}});
    }
    return Out::Ok(RequestPlan{
        op, "POST", base + "/images/pull", {{"reference", params.image}}, {}});

  default:
    break;
  }

  if (params.container_id.empty()) {
    return missing(op, "container id");
  }

  switch (op) {
  case Operation::InspectContainer:
    return Out::Ok(RequestPlan{op, "GET", container_path("/json"), {}, {}});
  case Operation::StartContainer:
    return Out::Ok(RequestPlan{op, "POST", container_path("/start"), {}, {}});
  case Operation::StopContainer:
    return Out::Ok(RequestPlan{op, "POST", container_path("/stop"), {}, {}});
  case Operation::RestartContainer:
    return Out::Ok(
        RequestPlan{op, "POST", container_path("/restart"), {}, {}});
  case Operation::RemoveContainer:
    return Out::Ok(RequestPlan{op,
                               "DELETE",
                               container_path(""),
                               {{"force", bool_param(params.force)}},
                               {}});
  case Operation::ContainerStats:
    return Out::Ok(RequestPlan{
        op, "GET", container_path("/stats"), {{"stream", "false"}}, {}});
  case Operation::ContainerLogs: {
    RequestPlan plan{op,
                     "GET",
                     container_path("/logs"),
                     {{"stdout", "true"},
                      {"stderr", "true"},
                      {"tail", std::to_string(std::max(params.tail, 0))},
                      {"timestamps", "true"}},
                     {},
                     BodyMode::Binary};
    if (dialect_ == Dialect::Podman) {
      plan.query.emplace_back("details", "true");
      plan.query.emplace_back("multi", "true");
    }
    return Out::Ok(std::move(plan));
  }
  default:
    break;
  }

  return Out::Error(GatewayError::dialect(
      fmt::format("operation {} is not supported for the {} dialect",
                  to_string(op), to_string(dialect_))));
}

GatewayResult<RequestPlan>
DialectTranslator::plan_create(const OperationParams &params) const {
  using Out = GatewayResult<RequestPlan>;
  if (!params.spec || params.spec->image.empty()) {
    return missing(Operation::CreateContainer, "container spec with an image");
  }

  const std::string path = std::string(prefix()) + "/containers/create";
  auto shape = shape_create_request(dialect_, *params.spec);

  return std::visit(
      overloaded{
          [&](const DockerCreateShape &docker) {
            RequestPlan plan{Operation::CreateContainer, "POST", path, {},
                             docker.body.dump()};
            if (!docker.name.empty()) {
              plan.query.emplace_back("name", docker.name);
            }
            return Out::Ok(std::move(plan));
          },
          [&](const PodmanCreateShape &podman) {
            return Out::Ok(RequestPlan{Operation::CreateContainer, "POST",
                                       path, {}, podman.body.dump()});
          }},
      shape);
}

GatewayResult<RequestPlan>
DialectTranslator::passthrough(std::string method, std::string_view api_path,
                               std::string_view raw_query,
                               std::string body) const {
  using Out = GatewayResult<RequestPlan>;
  if (api_path.empty() || api_path.front() != '/') {
    return Out::Error(GatewayError::dialect(
        fmt::format("runtime API path must be absolute: '{}'", api_path)));
  }
  if (api_path.find("..") != std::string_view::npos) {
    return Out::Error(GatewayError::dialect(
        fmt::format("runtime API path may not contain '..': '{}'", api_path)));
  }

  std::string path = std::string(prefix()) + std::string(api_path);
  if (!raw_query.empty()) {
    path += '?';
    path += raw_query;
  }

  RequestPlan plan{Operation::RuntimeInfo, std::move(method), std::move(path),
                   {}, std::move(body)};
  if (api_path.find("/logs") != std::string_view::npos) {
    plan.operation = Operation::ContainerLogs;
    plan.body_mode = BodyMode::Binary;
  }
  return Out::Ok(std::move(plan));
}

CreateReply
DialectTranslator::normalize_create_reply(const json &reply) const {
  if (!reply.is_object()) {
    return {};
  }

  // Native casing first, the other one as a fallback.
  bool docker = dialect_ == Dialect::Docker;
  CreateReply out;
  out.id = docker ? string_field(reply, "Id", "id")
                  : string_field(reply, "id", "Id");
  const json *warnings = docker ? array_field(reply, "Warnings", "warnings")
                                : array_field(reply, "warnings", "Warnings");
  if (warnings) {
    out.warnings = string_array(*warnings);
  }
  return out;
}

} // namespace dbdock::runtime
