#include "api.hpp"

#include <algorithm>
#include <charconv>
#include <spdlog/spdlog.h>
#include <thread>

namespace dbdock::api {

namespace {

constexpr int kDefaultLogTail = 100;

std::string containerId(const Pistache::Rest::Request &request) {
  return request.param(":id").as<std::string>();
}

int tailFromQuery(const Pistache::Rest::Request &request) {
  auto tail = responses::getQuery(request, "tail");
  if (!tail) {
    return kDefaultLogTail;
  }
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(tail->data(), tail->data() + tail->size(), value);
  if (ec != std::errc{} || ptr != tail->data() + tail->size() || value < 0) {
    return kDefaultLogTail;
  }
  return value;
}

} // namespace

DbDockApi::DbDockApi(const config::ServerSection &settings,
                     std::shared_ptr<ApiHandlers> handlers)
    : settings_(settings), handlers_(std::move(handlers)),
      httpEndpoint(std::make_unique<Pistache::Http::Endpoint>(
          Pistache::Address(settings.host,
                            Pistache::Port(static_cast<uint16_t>(
                                settings.port))))) {}

void DbDockApi::init() {
  spdlog::info("Initializing Pistache API...");

  unsigned threads = settings_.threads != 0
                         ? settings_.threads
                         : std::max(1u, std::thread::hardware_concurrency());
  auto opts = Pistache::Http::Endpoint::options()
                  .threads(static_cast<int>(threads))
                  .flags(Pistache::Tcp::Options::ReuseAddr)
                  .maxRequestSize(50 * 1024 * 1024);

  httpEndpoint->init(opts);
  setupRoutes();

  spdlog::info("Pistache API initialized with {} threads", threads);
}

void DbDockApi::start() {
  spdlog::info("Starting Pistache server on {}:{}", settings_.host,
               settings_.port);
  httpEndpoint->setHandler(router.handler());
  httpEndpoint->serveThreaded();
}

void DbDockApi::shutdown() {
  spdlog::info("Shutting down Pistache server");
  httpEndpoint->shutdown();
}

void DbDockApi::setupRoutes() {
  using namespace Pistache::Rest;

  Routes::Options(router, "/*", Routes::bind(&DbDockApi::handleCors, this));
  Routes::Get(router, "/", Routes::bind(&DbDockApi::handleRoot, this));
  Routes::Get(router, "/health", Routes::bind(&DbDockApi::handleHealth, this));
  Routes::Get(router, "/api/info", Routes::bind(&DbDockApi::handleInfo, this));

  Routes::Get(router, "/api/containers",
              Routes::bind(&DbDockApi::handleContainerList, this));
  Routes::Get(router, "/api/containers/:id",
              Routes::bind(&DbDockApi::handleContainerInspect, this));
  Routes::Post(router, "/api/containers/:id/start",
               Routes::bind(&DbDockApi::handleContainerStart, this));
  Routes::Post(router, "/api/containers/:id/stop",
               Routes::bind(&DbDockApi::handleContainerStop, this));
  Routes::Post(router, "/api/containers/:id/restart",
               Routes::bind(&DbDockApi::handleContainerRestart, this));
  Routes::Delete(router, "/api/containers/:id",
                 Routes::bind(&DbDockApi::handleContainerDelete, this));
  Routes::Get(router, "/api/containers/:id/logs",
              Routes::bind(&DbDockApi::handleContainerLogs, this));
  Routes::Get(router, "/api/containers/:id/stats",
              Routes::bind(&DbDockApi::handleContainerStats, this));

  Routes::Post(router, "/api/deployments",
               Routes::bind(&DbDockApi::handleDeploy, this));

  Routes::Get(router, "/api/filesystem",
              Routes::bind(&DbDockApi::handleFilesystemBrowse, this));
  Routes::Get(router, "/api/filesystem/ls",
              Routes::bind(&DbDockApi::handleFilesystemLs, this));
  Routes::Post(router, "/api/filesystem/mkdir",
               Routes::bind(&DbDockApi::handleFilesystemMkdir, this));
  Routes::Post(router, "/api/container/user-info",
               Routes::bind(&DbDockApi::handleUserInfo, this));

  Routes::NotFound(router, Routes::bind(&DbDockApi::handleFallback, this));

  spdlog::info("Routes registered");
}

void DbDockApi::applyCors(const Pistache::Rest::Request &request,
                          Pistache::Http::ResponseWriter &response) {
  std::string origin;
  if (auto raw = request.headers().tryGetRaw("Origin")) {
    origin = raw->value();
  }
  if (auto allowed = resolve_cors_origin(settings_.cors, origin)) {
    responses::addCorsHeaders(response, *allowed);
  }
}

void DbDockApi::reply(const Pistache::Rest::Request &request,
                      Pistache::Http::ResponseWriter &response,
                      utils::HttpResult &result, Pistache::Http::Code code) {
  applyCors(request, response);
  responses::handleJsonResult(result, response, code);
}

void DbDockApi::handleCors(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response) {
  applyCors(request, response);
  response.send(Pistache::Http::Code::Ok);
}

void DbDockApi::handleRoot(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response) {
  auto result = handlers_->describe();
  reply(request, response, result);
}

void DbDockApi::handleHealth(const Pistache::Rest::Request &request,
                             Pistache::Http::ResponseWriter response) {
  auto result = handlers_->health();
  reply(request, response, result);
}

void DbDockApi::handleInfo(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response) {
  auto result = handlers_->runtime_info();
  reply(request, response, result);
}

void DbDockApi::handleContainerList(const Pistache::Rest::Request &request,
                                    Pistache::Http::ResponseWriter response) {
  auto result =
      handlers_->list_containers(responses::getQueryFlag(request, "all"),
                                 responses::getQueryFlag(request, "managed"));
  reply(request, response, result);
}

void DbDockApi::handleContainerInspect(
    const Pistache::Rest::Request &request,
    Pistache::Http::ResponseWriter response) {
  auto result = handlers_->inspect_container(containerId(request));
  reply(request, response, result);
}

void DbDockApi::handleContainerStart(const Pistache::Rest::Request &request,
                                     Pistache::Http::ResponseWriter response) {
  auto result = handlers_->container_action(
      runtime::Operation::StartContainer, containerId(request));
  reply(request, response, result);
}

void DbDockApi::handleContainerStop(const Pistache::Rest::Request &request,
                                    Pistache::Http::ResponseWriter response) {
  auto result = handlers_->container_action(runtime::Operation::StopContainer,
                                            containerId(request));
  reply(request, response, result);
}

void DbDockApi::handleContainerRestart(
    const Pistache::Rest::Request &request,
    Pistache::Http::ResponseWriter response) {
  auto result = handlers_->container_action(
      runtime::Operation::RestartContainer, containerId(request));
  reply(request, response, result);
}

void DbDockApi::handleContainerDelete(const Pistache::Rest::Request &request,
                                      Pistache::Http::ResponseWriter response) {
  auto result = handlers_->remove_container(
      containerId(request), responses::getQueryFlag(request, "force"));
  reply(request, response, result);
}

void DbDockApi::handleContainerLogs(const Pistache::Rest::Request &request,
                                    Pistache::Http::ResponseWriter response) {
  auto result =
      handlers_->container_logs(containerId(request), tailFromQuery(request));
  reply(request, response, result);
}

void DbDockApi::handleContainerStats(const Pistache::Rest::Request &request,
                                     Pistache::Http::ResponseWriter response) {
  auto result = handlers_->container_stats(containerId(request));
  reply(request, response, result);
}

void DbDockApi::handleDeploy(const Pistache::Rest::Request &request,
                             Pistache::Http::ResponseWriter response) {
  auto result = responses::parseJsonBody(request.body())
                    .and_then([this](Json::Value json) {
                      return handlers_->deploy(json);
                    });
  reply(request, response, result, Pistache::Http::Code::Created);
}

void DbDockApi::handleFilesystemBrowse(
    const Pistache::Rest::Request &request,
    Pistache::Http::ResponseWriter response) {
  auto result = handlers_->list_directories(
      responses::getQuery(request, "path").value_or("/"));
  reply(request, response, result);
}

void DbDockApi::handleFilesystemLs(const Pistache::Rest::Request &request,
                                   Pistache::Http::ResponseWriter response) {
  auto result =
      handlers_->stat_path(responses::getQuery(request, "path").value_or("/"));
  reply(request, response, result);
}

void DbDockApi::handleFilesystemMkdir(const Pistache::Rest::Request &request,
                                      Pistache::Http::ResponseWriter response) {
  auto result = responses::parseJsonBody(request.body())
                    .and_then([this](Json::Value json) {
                      return handlers_->make_directory(json);
                    });
  reply(request, response, result, Pistache::Http::Code::Created);
}

void DbDockApi::handleUserInfo(const Pistache::Rest::Request &request,
                               Pistache::Http::ResponseWriter response) {
  auto result = responses::parseJsonBody(request.body())
                    .and_then([this](Json::Value json) {
                      return handlers_->user_info(json);
                    });
  reply(request, response, result);
}

void DbDockApi::handleFallback(const Pistache::Rest::Request &request,
                               Pistache::Http::ResponseWriter response) {
  applyCors(request, response);

  if (request.method() == Pistache::Http::Method::Options) {
    response.send(Pistache::Http::Code::Ok);
    return;
  }

  auto bridged = passthrough_path(request.resource());
  if (!bridged) {
    responses::sendError(response, "Not found",
                         Pistache::Http::Code::Not_Found);
    return;
  }

  const std::string &api_path = *bridged;
  std::string query = request.query().as_str();
  if (!query.empty() && query.front() == '?') {
    query.erase(0, 1);
  }
  std::string method = Pistache::Http::methodString(request.method());

  spdlog::debug("Passthrough {} {}", method, api_path);
  auto forwarded = handlers_->forward(method, api_path, query, request.body());
  if (!forwarded) {
    responses::sendError(response, forwarded.error());
    return;
  }

  const auto &relayed = forwarded.value();
  response.headers().add<Pistache::Http::Header::ContentType>(
      Pistache::Http::Mime::MediaType(relayed.content_type));
  response.send(static_cast<Pistache::Http::Code>(relayed.status),
                relayed.body);
}

} // namespace dbdock::api
