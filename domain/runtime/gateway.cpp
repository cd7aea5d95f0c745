#include "gateway.hpp"

#include "decoder.hpp"
#include "log_demux.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <optional>
#include <spdlog/spdlog.h>

namespace dbdock::runtime {

namespace {

using json = nlohmann::json;

Payload make_payload(const RawResponse &response, BodyMode mode) {
  if (mode == BodyMode::Binary && response.ok()) {
    return LogLines{demultiplex_logs(response.body)};
  }

  // Error bodies on the logs path are ordinary JSON and were not sanitized
  // by the decoder.
  std::string body = mode == BodyMode::Binary ? sanitize_text(response.body)
                                              : response.body;

  if (!boost::algorithm::icontains(response.header("content-type"), "json")) {
    return Raw{std::move(body)};
  }

  auto cleaned = sanitize_for_json(body);
  if (cleaned.empty()) {
    return Raw{std::move(body)};
  }
  auto parsed = json::parse(cleaned, nullptr, false);
  if (parsed.is_discarded()) {
    spdlog::warn("Runtime body declared JSON but did not parse ({} bytes), "
                 "returning text",
                 cleaned.size());
    return Raw{std::move(body)};
  }
  return Parsed{std::move(parsed)};
}

std::string error_message(const NormalizedResult &result) {
  if (const json *body = result.json(); body && body->is_object()) {
    for (const char *key : {"message", "cause", "error"}) {
      auto it = body->find(key);
      if (it != body->end() && it->is_string()) {
        return it->get<std::string>();
      }
    }
  }
  auto text = result.text();
  if (!text.empty()) {
    return text;
  }
  return result.status_text;
}

// Image pulls answer 200 and report failures inside the progress stream as
// an object carrying "error" (libpod) or "error" plus "errorDetail" (Docker).
std::optional<std::string> pull_stream_error(const NormalizedResult &result) {
  std::optional<std::string> found;
  auto inspect = [&found](const json &object) {
    if (!object.is_object()) {
      return;
    }
    auto it = object.find("error");
    if (it != object.end() && it->is_string() &&
        !it->get_ref<const std::string &>().empty()) {
      found = it->get<std::string>();
    }
  };

  if (const json *body = result.json()) {
    inspect(*body);
    return found;
  }
  for (const auto &line : split_lines(result.text())) {
    auto parsed = json::parse(line, nullptr, false);
    if (!parsed.is_discarded()) {
      inspect(parsed);
    }
  }
  return found;
}

// 304 from start/stop means the container is already in the target state.
bool accepts_not_modified(Operation op) {
  return op == Operation::StartContainer || op == Operation::StopContainer;
}

} // namespace

const json *NormalizedResult::json() const {
  const auto *parsed = std::get_if<Parsed>(&payload);
  return parsed ? &parsed->value : nullptr;
}

std::string NormalizedResult::text() const {
  if (const auto *parsed = std::get_if<Parsed>(&payload)) {
    return parsed->value.dump();
  }
  if (const auto *raw = std::get_if<Raw>(&payload)) {
    return raw->text;
  }
  const auto &lines = std::get<LogLines>(payload).lines;
  return fmt::format("{}", fmt::join(lines, "\n"));
}

RuntimeGateway::RuntimeGateway(RuntimeEndpoint endpoint,
                               std::shared_ptr<ITransport> transport)
    : endpoint_(std::move(endpoint)), translator_(endpoint_.dialect()),
      transport_(std::move(transport)) {}

GatewayResult<NormalizedResult>
RuntimeGateway::invoke(Operation op, const OperationParams &params) const {
  return translator_.translate(op, params)
      .and_then([this](const RequestPlan &plan) { return execute(plan); });
}

GatewayResult<NormalizedResult>
RuntimeGateway::forward(std::string method, std::string_view api_path,
                        std::string_view raw_query, std::string body) const {
  return translator_
      .passthrough(std::move(method), api_path, raw_query, std::move(body))
      .and_then([this](const RequestPlan &plan) { return execute(plan); });
}

GatewayResult<NormalizedResult>
RuntimeGateway::execute(const RequestPlan &plan) const {
  HttpRequest request{plan.method, plan.target(), {}, plan.body};
  if (!plan.body.empty()) {
    request.headers.emplace_back("Content-Type", "application/json");
  }

  const BodyMode mode = plan.body_mode;
  return transport_->round_trip(endpoint_, request)
      .and_then([mode](const std::string &raw) {
        return decode_response(raw, mode);
      })
      .map([mode](const RawResponse &response) {
        NormalizedResult result;
        result.status_code = response.status_code;
        result.status_text = response.status_text;
        result.headers = response.headers;
        result.payload = make_payload(response, mode);
        return result;
      });
}

GatewayResult<NormalizedResult>
RuntimeGateway::checked(Operation op, const OperationParams &params) const {
  using Out = GatewayResult<NormalizedResult>;
  return invoke(op, params).and_then([op](NormalizedResult &&result) {
    if (result.ok() ||
        (result.status_code == 304 && accepts_not_modified(op))) {
      return Out::Ok(std::move(result));
    }
    return Out::Error(GatewayError::runtime(
        result.status_code,
        fmt::format("{} failed with HTTP {}: {}", to_string(op),
                    result.status_code, error_message(result))));
  });
}

GatewayStatus RuntimeGateway::lifecycle(Operation op,
                                        const std::string &id) const {
  OperationParams params;
  params.container_id = id;
  return checked(op, params).map([](const NormalizedResult &) {
    return core::Unit{};
  });
}

GatewayResult<json> RuntimeGateway::info() const {
  using Out = GatewayResult<json>;
  return checked(Operation::RuntimeInfo, {})
      .and_then([](const NormalizedResult &result) {
        if (const json *body = result.json()) {
          return Out::Ok(*body);
        }
        return Out::Error(
            GatewayError::decode("runtime info response was not JSON"));
      });
}

GatewayResult<std::vector<ContainerRecord>>
RuntimeGateway::list_containers(bool all) const {
  using Out = GatewayResult<std::vector<ContainerRecord>>;
  OperationParams params;
  params.all = all;
  return checked(Operation::ListContainers, params)
      .and_then([](const NormalizedResult &result) {
        const json *body = result.json();
        if (!body || !body->is_array()) {
          return Out::Error(GatewayError::decode(
              "container list response was not a JSON array"));
        }
        return Out::Ok(normalize_container_list(*body));
      });
}

GatewayResult<ContainerRecord>
RuntimeGateway::inspect_container(const std::string &id) const {
  using Out = GatewayResult<ContainerRecord>;
  OperationParams params;
  params.container_id = id;
  return checked(Operation::InspectContainer, params)
      .and_then([](const NormalizedResult &result) {
        const json *body = result.json();
        if (!body || !body->is_object()) {
          return Out::Error(GatewayError::decode(
              "container inspect response was not a JSON object"));
        }
        return Out::Ok(normalize_container(*body));
      });
}

GatewayResult<CreateReply>
RuntimeGateway::create_container(const ContainerSpec &spec) const {
  using Out = GatewayResult<CreateReply>;
  OperationParams params;
  params.spec = spec;
  return checked(Operation::CreateContainer, params)
      .and_then([this, &spec](const NormalizedResult &result) {
        const json *body = result.json();
        auto reply = body ? translator_.normalize_create_reply(*body)
                          : CreateReply{};
        if (reply.id.empty()) {
          return Out::Error(GatewayError::decode(
              fmt::format("create reply carried no container id: {}",
                          result.text())));
        }
        for (const auto &warning : reply.warnings) {
          spdlog::warn("Runtime warning for {}: {}", spec.name, warning);
        }
        return Out::Ok(std::move(reply));
      });
}

GatewayStatus RuntimeGateway::start_container(const std::string &id) const {
  return lifecycle(Operation::StartContainer, id);
}

GatewayStatus RuntimeGateway::stop_container(const std::string &id) const {
  return lifecycle(Operation::StopContainer, id);
}

GatewayStatus RuntimeGateway::restart_container(const std::string &id) const {
  return lifecycle(Operation::RestartContainer, id);
}

GatewayStatus RuntimeGateway::remove_container(const std::string &id,
                                               bool force) const {
  OperationParams params;
  params.container_id = id;
  params.force = force;
  return checked(Operation::RemoveContainer, params)
      .map([](const NormalizedResult &) { return core::Unit{}; });
}

GatewayStatus RuntimeGateway::pull_image(const std::string &image) const {
  OperationParams params;
  params.image = image;
  return checked(Operation::PullImage, params)
      .and_then([&image](const NormalizedResult &result) {
        if (auto failure = pull_stream_error(result)) {
          return GatewayStatus::Error(GatewayError::runtime(
              result.status_code,
              fmt::format("pull {} failed: {}", image, *failure)));
        }
        spdlog::debug("Pulled {} ({} bytes of progress output)", image,
                      result.text().size());
        return core::ok_status<GatewayError>();
      });
}

GatewayResult<std::vector<std::string>>
RuntimeGateway::container_logs(const std::string &id, int tail) const {
  OperationParams params;
  params.container_id = id;
  params.tail = tail;
  return checked(Operation::ContainerLogs, params)
      .map([](NormalizedResult &&result) {
        if (auto *logs = std::get_if<LogLines>(&result.payload)) {
          return std::move(logs->lines);
        }
        return split_lines(result.text());
      });
}

GatewayResult<StatsSnapshot>
RuntimeGateway::container_stats(const std::string &id) const {
  using Out = GatewayResult<StatsSnapshot>;
  OperationParams params;
  params.container_id = id;
  return checked(Operation::ContainerStats, params)
      .and_then([](const NormalizedResult &result) {
        const json *body = result.json();
        if (!body || !body->is_object()) {
          return Out::Error(
              GatewayError::decode("container stats response was not JSON"));
        }
        return Out::Ok(normalize_stats(*body));
      });
}

} // namespace dbdock::runtime
