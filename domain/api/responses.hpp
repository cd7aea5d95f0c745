#ifndef DBDOCK_API_RESPONSES_HPP
#define DBDOCK_API_RESPONSES_HPP

#include "infrastructure/result.hpp"
#include "utils/http_helpers.hpp"

#include <json/json.h>
#include <pistache/http.h>
#include <optional>
#include <pistache/router.h>
#include <string>

namespace dbdock::api::responses {

inline void addCorsHeaders(Pistache::Http::ResponseWriter &response,
                           const std::string &origin = "*") {
  response.headers().add<Pistache::Http::Header::AccessControlAllowOrigin>(
      origin);
  response.headers().add<Pistache::Http::Header::AccessControlAllowMethods>(
      "GET, POST, PUT, DELETE, OPTIONS");
  response.headers().add<Pistache::Http::Header::AccessControlAllowHeaders>(
      "Content-Type, Authorization");
}

inline void sendJson(Pistache::Http::ResponseWriter &response,
                     const Json::Value &body, Pistache::Http::Code code) {
  response.headers().add<Pistache::Http::Header::ContentType>(
      MIME(Application, Json));
  response.send(code, body.toStyledString());
}

inline void sendSuccess(Pistache::Http::ResponseWriter &response,
                        const Json::Value &data,
                        Pistache::Http::Code code = Pistache::Http::Code::Ok) {
  sendJson(response, data, code);
}

inline void sendError(Pistache::Http::ResponseWriter &response,
                      const utils::HttpError &error) {
  utils::notify_error(error);
  sendJson(response, utils::create_error_response(error),
           static_cast<Pistache::Http::Code>(error.status));
}

inline void
sendError(Pistache::Http::ResponseWriter &response, const std::string &message,
          Pistache::Http::Code code = Pistache::Http::Code::Bad_Request) {
  sendError(response,
            utils::make_http_error(static_cast<int>(code), message));
}

inline void handleJsonResult(utils::HttpResult &result,
                             Pistache::Http::ResponseWriter &response,
                             Pistache::Http::Code code = Pistache::Http::Code::Ok) {
  result.handle(
      [&response, code](Json::Value &data) {
        sendSuccess(response, data, code);
      },
      [&response](utils::HttpError &error) { sendError(response, error); });
}

inline utils::HttpResult parseJsonBody(const std::string &body) {
  Json::Value json;
  Json::Reader reader;
  if (!reader.parse(body, json)) {
    return utils::HttpResult::Error(
        utils::make_http_error(utils::http::BadRequest, "Invalid JSON"));
  }
  return utils::HttpResult::Ok(std::move(json));
}

inline std::optional<std::string>
getQuery(const Pistache::Rest::Request &request, const std::string &name) {
  auto value = request.query().get(name);
  if (!value || value->empty()) {
    return std::nullopt;
  }
  return std::string(*value);
}

inline bool getQueryFlag(const Pistache::Rest::Request &request,
                         const std::string &name) {
  auto value = getQuery(request, name);
  return value && (*value == "true" || *value == "1");
}

} // namespace dbdock::api::responses

#endif // DBDOCK_API_RESPONSES_HPP
