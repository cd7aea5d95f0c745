#ifndef CORE_INFRASTRUCTURE_RESULT_HPP
#define CORE_INFRASTRUCTURE_RESULT_HPP

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace core {

// Value-or-error carrier used across module boundaries in place of
// exceptions. Error types are expected to be cheap to copy.
template <typename T, typename Err = std::string> class Result {
private:
  std::variant<T, Err> data_;

  struct ValueTag {};
  struct ErrorTag {};

  template <typename V>
  Result(ValueTag, V &&value)
      : data_(std::in_place_index<0>, std::forward<V>(value)) {}

  template <typename E>
  Result(ErrorTag, E &&error)
      : data_(std::in_place_index<1>, std::forward<E>(error)) {}

public:
  using value_type = T;
  using error_type = Err;

  template <typename U>
    requires(!std::is_same_v<std::decay_t<U>, Result>) &&
            (!std::is_same_v<std::decay_t<U>, Err>) &&
            std::is_constructible_v<T, U &&>
  Result(U &&value) noexcept(std::is_nothrow_constructible_v<T, U &&>)
      : data_(std::in_place_index<0>, std::forward<U>(value)) {}

  template <typename E>
    requires(!std::is_same_v<std::decay_t<E>, Result>) &&
            (!std::is_constructible_v<T, E &&>) &&
            std::is_constructible_v<Err, E &&>
  Result(E &&error) noexcept(std::is_nothrow_constructible_v<Err, E &&>)
      : data_(std::in_place_index<1>, std::forward<E>(error)) {}

  bool is_ok() const noexcept { return data_.index() == 0; }
  bool is_err() const noexcept { return data_.index() == 1; }
  explicit operator bool() const noexcept { return is_ok(); }

  T &value() & { return std::get<0>(data_); }
  const T &value() const & { return std::get<0>(data_); }
  T &&value() && { return std::get<0>(std::move(data_)); }

  Err &error() & { return std::get<1>(data_); }
  const Err &error() const & { return std::get<1>(data_); }
  Err &&error() && { return std::get<1>(std::move(data_)); }

  T value_or(T fallback) const & {
    if (is_ok()) {
      return value();
    }
    return fallback;
  }

  T expect(const char *message) && {
    if (!is_ok()) {
      throw std::runtime_error(message);
    }
    return std::move(value());
  }

  template <typename F>
  auto map(F &&func) const &
      -> Result<std::invoke_result_t<F, const T &>, Err> {
    using Mapped = Result<std::invoke_result_t<F, const T &>, Err>;
    if (!is_ok()) {
      return Mapped::Error(error());
    }
    return Mapped::Ok(func(value()));
  }

  template <typename F>
  auto map(F &&func) && -> Result<std::invoke_result_t<F, T &&>, Err> {
    using Mapped = Result<std::invoke_result_t<F, T &&>, Err>;
    if (!is_ok()) {
      return Mapped::Error(std::move(error()));
    }
    return Mapped::Ok(func(std::move(value())));
  }

  template <typename F>
  auto map_error(F &&func) const &
      -> Result<T, std::invoke_result_t<F, const Err &>> {
    using Mapped = Result<T, std::invoke_result_t<F, const Err &>>;
    if (is_ok()) {
      return Mapped::Ok(value());
    }
    return Mapped::Error(func(error()));
  }

  template <typename F>
  auto and_then(F &&func) const & -> std::invoke_result_t<F, const T &> {
    using Chained = std::invoke_result_t<F, const T &>;
    if (!is_ok()) {
      return Chained::Error(error());
    }
    return func(value());
  }

  template <typename F>
  auto and_then(F &&func) && -> std::invoke_result_t<F, T &&> {
    using Chained = std::invoke_result_t<F, T &&>;
    if (!is_ok()) {
      return Chained::Error(std::move(error()));
    }
    return func(std::move(value()));
  }

  template <typename OkHandler, typename ErrHandler>
  auto match(OkHandler &&ok_func, ErrHandler &&err_func) const &
      -> std::common_type_t<std::invoke_result_t<OkHandler, const T &>,
                            std::invoke_result_t<ErrHandler, const Err &>> {
    if (is_ok()) {
      return ok_func(value());
    }
    return err_func(error());
  }

  template <typename OkHandler, typename ErrHandler>
  void handle(OkHandler &&ok_func, ErrHandler &&err_func) & {
    if (is_ok()) {
      ok_func(value());
    } else {
      err_func(error());
    }
  }

  static Result Ok(T &&value) { return Result(ValueTag{}, std::move(value)); }

  static Result Ok(const T &value) { return Result(ValueTag{}, value); }

  static Result Error(Err &&error) {
    return Result(ErrorTag{}, std::move(error));
  }

  static Result Error(const Err &error) { return Result(ErrorTag{}, error); }
};

// Success marker for operations that only report failure.
struct Unit {};

template <typename Err = std::string> using Status = Result<Unit, Err>;

template <typename Err> Status<Err> ok_status() {
  return Status<Err>::Ok(Unit{});
}

} // namespace core

#endif // CORE_INFRASTRUCTURE_RESULT_HPP
