#ifndef CORE_UTILS_ERROR_HPP
#define CORE_UTILS_ERROR_HPP

#include <fmt/format.h>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace core::utils {

// Error tagged with a module-specific kind enum. The enum must provide an
// ADL-visible `to_string(Kind)` returning something convertible to
// std::string_view.
template <typename Kind> class Error {
public:
  Error(Kind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  Kind kind() const { return kind_; }
  const std::string &message() const { return message_; }
  std::string &message() { return message_; }

  bool is(Kind kind) const { return kind_ == kind; }

  std::string serialize() const {
    return fmt::format("{} error: {}", std::string_view(to_string(kind_)),
                       message_);
  }

  friend std::ostream &operator<<(std::ostream &os, const Error &error) {
    os << error.serialize();
    return os;
  }

private:
  Kind kind_;
  std::string message_;
};

} // namespace core::utils

#endif // CORE_UTILS_ERROR_HPP
