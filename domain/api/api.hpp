#ifndef DBDOCK_API_API_HPP
#define DBDOCK_API_API_HPP

#include "handlers.hpp"
#include "responses.hpp"

#include <config/config.hpp>

#include <memory>
#include <pistache/endpoint.h>
#include <pistache/http.h>
#include <pistache/router.h>

namespace dbdock::api {

class DbDockApi {
public:
  DbDockApi(const config::ServerSection &settings,
            std::shared_ptr<ApiHandlers> handlers);

  void init();
  // Serves on background threads; returns immediately.
  void start();
  void shutdown();

private:
  void setupRoutes();

  void reply(const Pistache::Rest::Request &request,
             Pistache::Http::ResponseWriter &response,
             utils::HttpResult &result,
             Pistache::Http::Code code = Pistache::Http::Code::Ok);
  void applyCors(const Pistache::Rest::Request &request,
                 Pistache::Http::ResponseWriter &response);

  void handleCors(const Pistache::Rest::Request &request,
                  Pistache::Http::ResponseWriter response);
  void handleRoot(const Pistache::Rest::Request &request,
                  Pistache::Http::ResponseWriter response);
  void handleHealth(const Pistache::Rest::Request &request,
                    Pistache::Http::ResponseWriter response);
  void handleInfo(const Pistache::Rest::Request &request,
                  Pistache::Http::ResponseWriter response);
  void handleContainerList(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response);
  void handleContainerInspect(const Pistache::Rest::Request &request,
                              Pistache::Http::ResponseWriter response);
  void handleContainerStart(const Pistache::Rest::Request &request,
                            Pistache::Http::ResponseWriter response);
  void handleContainerStop(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response);
  void handleContainerRestart(const Pistache::Rest::Request &request,
                              Pistache::Http::ResponseWriter response);
  void handleContainerDelete(const Pistache::Rest::Request &request,
                             Pistache::Http::ResponseWriter response);
  void handleContainerLogs(const Pistache::Rest::Request &request,
                           Pistache::Http::ResponseWriter response);
  void handleContainerStats(const Pistache::Rest::Request &request,
                            Pistache::Http::ResponseWriter response);
  void handleDeploy(const Pistache::Rest::Request &request,
                    Pistache::Http::ResponseWriter response);
  void handleFilesystemBrowse(const Pistache::Rest::Request &request,
                              Pistache::Http::ResponseWriter response);
  void handleFilesystemLs(const Pistache::Rest::Request &request,
                          Pistache::Http::ResponseWriter response);
  void handleFilesystemMkdir(const Pistache::Rest::Request &request,
                             Pistache::Http::ResponseWriter response);
  void handleUserInfo(const Pistache::Rest::Request &request,
                      Pistache::Http::ResponseWriter response);
  // Everything unmatched; /api/podman/* goes to the runtime.
  void handleFallback(const Pistache::Rest::Request &request,
                      Pistache::Http::ResponseWriter response);

  config::ServerSection settings_;
  std::shared_ptr<ApiHandlers> handlers_;
  std::unique_ptr<Pistache::Http::Endpoint> httpEndpoint;
  Pistache::Rest::Router router;
};

} // namespace dbdock::api

#endif // DBDOCK_API_API_HPP
