#ifndef DBDOCK_API_VALIDATE_HPP
#define DBDOCK_API_VALIDATE_HPP

#include "bodies.hpp"

#include <infrastructure/result.hpp>

#include <boost/hana.hpp>
#include <charconv>
#include <fmt/format.h>
#include <json/value.h>
#include <map>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace dbdock::api::validate {

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

// Fills an adapted body struct from a JSON object, field by field. Members
// declared std::optional may be absent or null; all others are required.
class Validator {
public:
  template <typename S>
  static inline core::Result<S, std::string> validate(const Json::Value &body) {
    if (!body.isObject()) {
      return core::Result<S, std::string>::Error(
          "Request body must be a JSON object");
    }

    S obj;
    std::string error;
    bool success = hana::unpack(hana::accessors<S>(), [&](auto &&...accessor) {
      return (validateField(body, accessor, obj, error) && ...);
    });

    if (success) {
      return obj;
    }

    return core::Result<S, std::string>::Error(std::move(error));
  }

private:
  template <typename S, typename Accessor>
  static bool validateField(const Json::Value &body, Accessor accessor, S &obj,
                            std::string &error) {
    auto name = hana::first(accessor);
    auto member_ptr = hana::second(accessor);
    std::string field_name = hana::to<char const *>(name);
    auto &member = member_ptr(obj);
    using Member = std::decay_t<decltype(member)>;

    if (!body.isMember(field_name) || body[field_name].isNull()) {
      if constexpr (is_optional<Member>::value) {
        member.reset();
        return true;
      } else {
        spdlog::debug("Missing field: {}", field_name);
        error = fmt::format("Missing required field: {}", field_name);
        return false;
      }
    }

    bool valid = false;
    if constexpr (is_optional<Member>::value) {
      typename Member::value_type inner{};
      valid = validateValue(body[field_name], inner);
      if (valid) {
        member = std::move(inner);
      }
    } else {
      valid = validateValue(body[field_name], member);
    }

    if (!valid) {
      error = fmt::format("Invalid type for field: {}", field_name);
    }
    return valid;
  }

  template <typename U>
  static bool validateValue(const Json::Value &json_value, U &member_ref) {
    if constexpr (std::is_same_v<U, std::string>) {
      if (json_value.isString()) {
        member_ref = json_value.asString();
        return true;
      }
      // Numeric values are accepted for text fields such as mode "755".
      if (json_value.isIntegral()) {
        member_ref = json_value.asString();
        return true;
      }
    } else if constexpr (std::is_same_v<U, int>) {
      if (json_value.isInt()) {
        member_ref = json_value.asInt();
        return true;
      }
      if (json_value.isString()) {
        const auto text = json_value.asString();
        int parsed = 0;
        auto [ptr, ec] =
            std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
          member_ref = parsed;
          return true;
        }
      }
    } else if constexpr (std::is_same_v<U, bool>) {
      if (json_value.isBool()) {
        member_ref = json_value.asBool();
        return true;
      }
    } else if constexpr (std::is_same_v<U, std::vector<std::string>>) {
      if (json_value.isArray()) {
        member_ref.clear();
        for (const auto &item : json_value) {
          if (item.isString()) {
            member_ref.push_back(item.asString());
          } else {
            return false;
          }
        }
        return true;
      }
    } else if constexpr (std::is_same_v<U,
                                        std::map<std::string, std::string>>) {
      if (json_value.isObject()) {
        member_ref.clear();
        for (const auto &key : json_value.getMemberNames()) {
          const auto &item = json_value[key];
          if (!item.isString() && !item.isNumeric() && !item.isBool()) {
            return false;
          }
          member_ref[key] = item.asString();
        }
        return true;
      }
    }

    spdlog::debug("Type mismatch for value, expected: {}", typeid(U).name());
    return false;
  }
};

} // namespace dbdock::api::validate

#endif // DBDOCK_API_VALIDATE_HPP
