#ifndef DBDOCK_UTILS_HTTP_HELPERS_HPP
#define DBDOCK_UTILS_HTTP_HELPERS_HPP

#include <infrastructure/notification.hpp>
#include <infrastructure/result.hpp>

#include <fmt/format.h>
#include <json/json.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace dbdock::utils {

namespace http {
enum StatusCode {
  OK = 200,
  Created = 201,
  BadRequest = 400,
  NotFound = 404,
  Conflict = 409,
  InternalServerError = 500,
  BadGateway = 502,
  ServiceUnavailable = 503,
  GatewayTimeout = 504
};
}

// Failed request as it goes back to the caller. Keys of `details` are
// merged into the error envelope next to status/error/code.
struct HttpError {
  int status = http::InternalServerError;
  std::string message;
  Json::Value details = Json::Value(Json::objectValue);

  std::string serialize() const {
    return fmt::format("{} {}", status, message);
  }
};

using HttpResult = core::Result<Json::Value, HttpError>;

inline HttpError make_http_error(int status, std::string message) {
  return HttpError{status, std::move(message), Json::Value(Json::objectValue)};
}

inline auto &get_error_notification() {
  static auto notif =
      core::make_notification<HttpError>([](const HttpError &error) {
        spdlog::warn("HTTP Error: {}", error.serialize());
      });
  return notif;
}

inline auto &get_server_error_notification() {
  static auto notif =
      core::make_notification<HttpError>([](const HttpError &error) {
        spdlog::error("HTTP Error: {}", error.serialize());
      });
  return notif;
}

inline void notify_error(const HttpError &error) {
  static const auto client_errors = get_error_notification().filter(
      [](const HttpError &e) { return e.status < 500; });
  static const auto server_errors = get_server_error_notification().filter(
      [](const HttpError &e) { return e.status >= 500; });
  client_errors(error);
  server_errors(error);
}

template <typename NamesContainer, typename... Args>
auto create_json_response(const NamesContainer &names, Args &&...args) {
  Json::Value response;
  auto it = std::begin(names);
  size_t index = 0;

  auto add_value = [&](auto &&value) {
    response[*(it + index)] = std::forward<decltype(value)>(value);
    index++;
  };

  (add_value(std::forward<Args>(args)), ...);
  return response;
}

template <typename T, typename... Args>
Json::Value create_success_response(std::initializer_list<T> names,
                                    Args &&...args) {
  Json::Value response;
  response["status"] = "success";

  if constexpr (sizeof...(Args) > 0) {
    response["data"] = create_json_response(names, std::forward<Args>(args)...);
  }

  return response;
}

inline Json::Value create_success_response(Json::Value data) {
  Json::Value response;
  response["status"] = "success";
  response["data"] = std::move(data);
  return response;
}

inline Json::Value create_error_response(const std::string &error_message,
                                         int status = http::InternalServerError) {
  Json::Value response;
  response["status"] = "error";
  response["error"] = error_message;
  response["code"] = status;
  return response;
}

inline Json::Value create_error_response(const HttpError &error) {
  auto response = create_error_response(error.message, error.status);
  if (error.details.isObject()) {
    for (const auto &key : error.details.getMemberNames()) {
      response[key] = error.details[key];
    }
  }
  return response;
}

// Runtime payloads arrive as nlohmann::json, responses go out as jsoncpp.
inline Json::Value to_json_value(const nlohmann::json &nj) {
  Json::Value result;

  if (nj.is_object()) {
    result = Json::Value(Json::objectValue);
    for (auto it = nj.begin(); it != nj.end(); ++it) {
      result[it.key()] = to_json_value(it.value());
    }
  } else if (nj.is_array()) {
    result = Json::Value(Json::arrayValue);
    for (const auto &item : nj) {
      result.append(to_json_value(item));
    }
  } else if (nj.is_string()) {
    result = nj.get<std::string>();
  } else if (nj.is_number_unsigned()) {
    result = static_cast<Json::UInt64>(nj.get<uint64_t>());
  } else if (nj.is_number_integer()) {
    result = static_cast<Json::Int64>(nj.get<int64_t>());
  } else if (nj.is_number_float()) {
    result = nj.get<double>();
  } else if (nj.is_boolean()) {
    result = nj.get<bool>();
  }

  return result;
}

} // namespace dbdock::utils

#endif // DBDOCK_UTILS_HTTP_HELPERS_HPP
