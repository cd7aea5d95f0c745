#ifndef DBDOCK_RUNTIME_ERRORS_HPP
#define DBDOCK_RUNTIME_ERRORS_HPP

#include <infrastructure/result.hpp>
#include <utils/error.hpp>

#include <string>
#include <string_view>

namespace dbdock::runtime {

enum class GatewayErrorKind {
  Transport, // socket missing, permission denied, connection reset
  Timeout,   // no bytes within the idle window
  Decode,    // status line / header block not understood
  Dialect,   // operation cannot be expressed for the active dialect
  Runtime    // well-formed response with a non-success status
};

constexpr std::string_view to_string(GatewayErrorKind kind) {
  switch (kind) {
  case GatewayErrorKind::Transport:
    return "transport";
  case GatewayErrorKind::Timeout:
    return "timeout";
  case GatewayErrorKind::Decode:
    return "decode";
  case GatewayErrorKind::Dialect:
    return "dialect";
  case GatewayErrorKind::Runtime:
    return "runtime";
  }
  return "unknown";
}

class GatewayError : public core::utils::Error<GatewayErrorKind> {
public:
  GatewayError(GatewayErrorKind kind, std::string message,
               int status_code = 0)
      : Error(kind, std::move(message)), status_code_(status_code) {}

  static GatewayError transport(std::string message) {
    return {GatewayErrorKind::Transport, std::move(message)};
  }
  static GatewayError timeout(std::string message) {
    return {GatewayErrorKind::Timeout, std::move(message)};
  }
  static GatewayError decode(std::string message) {
    return {GatewayErrorKind::Decode, std::move(message)};
  }
  static GatewayError dialect(std::string message) {
    return {GatewayErrorKind::Dialect, std::move(message)};
  }
  static GatewayError runtime(int status_code, std::string message) {
    return {GatewayErrorKind::Runtime, std::move(message), status_code};
  }

  // HTTP status reported by the runtime; 0 unless kind() == Runtime.
  int status_code() const { return status_code_; }

  bool retryable() const { return kind() == GatewayErrorKind::Timeout; }

private:
  int status_code_;
};

template <typename T> using GatewayResult = core::Result<T, GatewayError>;
using GatewayStatus = core::Status<GatewayError>;

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_ERRORS_HPP
