#ifndef DBDOCK_RUNTIME_GATEWAY_HPP
#define DBDOCK_RUNTIME_GATEWAY_HPP

#include "container_record.hpp"
#include "dialect.hpp"
#include "endpoint.hpp"
#include "errors.hpp"
#include "transport.hpp"

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace dbdock::runtime {

struct Parsed {
  nlohmann::json value;
};

// Sanitized body that did not parse as JSON, or was not declared as JSON.
struct Raw {
  std::string text;
};

struct LogLines {
  std::vector<std::string> lines;
};

using Payload = std::variant<Parsed, Raw, LogLines>;

struct NormalizedResult {
  int status_code = 0;
  std::string status_text;
  std::map<std::string, std::string> headers;
  Payload payload;

  bool ok() const { return status_code >= 200 && status_code < 300; }

  // nullptr unless the payload is Parsed.
  const nlohmann::json *json() const;
  // Payload rendered as text regardless of its alternative.
  std::string text() const;
};

class RuntimeGateway {
public:
  RuntimeGateway(RuntimeEndpoint endpoint,
                 std::shared_ptr<ITransport> transport);

  const RuntimeEndpoint &endpoint() const { return endpoint_; }
  Dialect dialect() const { return endpoint_.dialect(); }

  // Translate, send, decode. A non-2xx status is not an error here; the
  // caller gets the normalized result and decides.
  GatewayResult<NormalizedResult> invoke(Operation op,
                                         const OperationParams &params) const;

  // Dialect-prefixed passthrough for arbitrary runtime API paths.
  GatewayResult<NormalizedResult> forward(std::string method,
                                          std::string_view api_path,
                                          std::string_view raw_query,
                                          std::string body) const;

  GatewayResult<nlohmann::json> info() const;
  GatewayResult<std::vector<ContainerRecord>> list_containers(bool all) const;
  GatewayResult<ContainerRecord> inspect_container(const std::string &id) const;
  GatewayResult<CreateReply> create_container(const ContainerSpec &spec) const;
  GatewayStatus start_container(const std::string &id) const;
  GatewayStatus stop_container(const std::string &id) const;
  GatewayStatus restart_container(const std::string &id) const;
  GatewayStatus remove_container(const std::string &id, bool force) const;
  // Progress output is drained and dropped.
  GatewayStatus pull_image(const std::string &image) const;
  GatewayResult<std::vector<std::string>>
  container_logs(const std::string &id, int tail) const;
  GatewayResult<StatsSnapshot> container_stats(const std::string &id) const;

private:
  GatewayResult<NormalizedResult> execute(const RequestPlan &plan) const;
  GatewayResult<NormalizedResult> checked(Operation op,
                                          const OperationParams &params) const;
  GatewayStatus lifecycle(Operation op, const std::string &id) const;

  RuntimeEndpoint endpoint_;
  DialectTranslator translator_;
  std::shared_ptr<ITransport> transport_;
};

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_GATEWAY_HPP
