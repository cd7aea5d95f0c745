#ifndef DBDOCK_HOST_NUMERIC_ID_HPP
#define DBDOCK_HOST_NUMERIC_ID_HPP

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <sys/types.h>

namespace dbdock::host {

// Decimal uid/gid. Anything that is not all digits, does not fit, or equals
// the (uid_t)-1 "leave unchanged" value of chown(2) is rejected.
inline std::optional<uint32_t> parse_numeric_id(std::string_view text) {
  static_assert(sizeof(uid_t) == sizeof(uint32_t) &&
                sizeof(gid_t) == sizeof(uint32_t));

  uint64_t value = 0;
  const char *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc{} || ptr != end ||
      value >= std::numeric_limits<uid_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

} // namespace dbdock::host

#endif // DBDOCK_HOST_NUMERIC_ID_HPP
