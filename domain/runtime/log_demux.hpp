#ifndef DBDOCK_RUNTIME_LOG_DEMUX_HPP
#define DBDOCK_RUNTIME_LOG_DEMUX_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dbdock::runtime {

enum class LogStream : uint8_t { Stdin = 0, Stdout = 1, Stderr = 2 };

constexpr size_t kLogFrameHeaderSize = 8;

// Turns a "container logs" body into ordered, non-blank lines. Framed
// records ([stream:1][reserved:3][length:4 BE] + payload) are unpacked in
// order; at the first header that cannot be trusted the rest of the buffer
// is read as plain text. Never fails.
std::vector<std::string> demultiplex_logs(std::string_view body);

// Splits on '\n' and drops lines that are empty or whitespace only.
std::vector<std::string> split_lines(std::string_view text);

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_LOG_DEMUX_HPP
