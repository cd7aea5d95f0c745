#ifndef CORE_INFRASTRUCTURE_CONCEPTS_HPP
#define CORE_INFRASTRUCTURE_CONCEPTS_HPP

#include <chrono>
#include <concepts>
#include <string>
#include <type_traits>

namespace core {

template <typename T>
concept Stringify = requires(const T &obj) {
  requires std::same_as<T, std::string> || requires {
    { obj.toString() } -> std::same_as<std::string>;
  } || requires {
    { std::to_string(obj) } -> std::same_as<std::string>;
  };
};

template <typename T>
concept Serializable = requires(const T &t) {
  requires Stringify<T> || requires {
    { t.serialize() } -> std::same_as<std::string>;
  };
};

template <typename T>
concept IsChronable = requires {
  typename T::rep;
  typename T::period;
  requires std::is_same_v<
      T, std::chrono::duration<typename T::rep, typename T::period>>;
} && requires(T duration) {
  { duration.count() } -> std::convertible_to<typename T::rep>;
};

} // namespace core

#endif // CORE_INFRASTRUCTURE_CONCEPTS_HPP
