#ifndef DBDOCK_RUNTIME_DIALECT_HPP
#define DBDOCK_RUNTIME_DIALECT_HPP

#include "decoder.hpp"
#include "endpoint.hpp"
#include "errors.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace dbdock::runtime {

enum class Operation {
  RuntimeInfo,
  ListContainers,
  InspectContainer,
  CreateContainer,
  StartContainer,
  StopContainer,
  RestartContainer,
  RemoveContainer,
  PullImage,
  ContainerLogs,
  ContainerStats
};

std::string_view to_string(Operation op);

// Dialect-neutral description of a container to create.
struct ContainerSpec {
  std::string name;
  std::string image;
  std::vector<std::string> env;
  // "<port>/<proto>" -> host port
  std::map<std::string, std::string> port_bindings;
  std::vector<std::string> binds;
  std::map<std::string, std::string> labels;
};

struct OperationParams {
  std::string container_id;
  std::string image;
  bool all = false;
  bool force = false;
  int tail = 100;
  std::optional<ContainerSpec> spec;
};

// Create request as each dialect wants it. Resolved once in the translator
// and serialized immediately; never handed to callers.
struct DockerCreateShape {
  std::string name; // travels as ?name=
  nlohmann::json body;
};

struct PodmanCreateShape {
  nlohmann::json body; // carries "Name"
};

using CreateShape = std::variant<DockerCreateShape, PodmanCreateShape>;

CreateShape shape_create_request(Dialect dialect, const ContainerSpec &spec);

struct CreateReply {
  std::string id;
  std::vector<std::string> warnings;
};

struct RequestPlan {
  Operation operation;
  std::string method;
  std::string path; // includes the dialect prefix
  std::vector<std::pair<std::string, std::string>> query;
  std::string body;
  BodyMode body_mode = BodyMode::Text;

  // Path plus percent-encoded query string.
  std::string target() const;
};

std::string url_encode(std::string_view input);

class DialectTranslator {
public:
  explicit DialectTranslator(Dialect dialect) : dialect_(dialect) {}

  Dialect dialect() const { return dialect_; }
  std::string_view prefix() const;

  GatewayResult<RequestPlan> translate(Operation op,
                                       const OperationParams &params) const;

  // Arbitrary runtime API path under the dialect prefix. The raw query
  // string is forwarded as-is.
  GatewayResult<RequestPlan> passthrough(std::string method,
                                         std::string_view api_path,
                                         std::string_view raw_query,
                                         std::string body) const;

  // Id/Warnings vs id/warnings folded into one shape.
  CreateReply normalize_create_reply(const nlohmann::json &reply) const;

private:
  GatewayResult<RequestPlan> plan_create(const OperationParams &params) const;

  Dialect dialect_;
};

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_DIALECT_HPP
