#include "log_demux.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace dbdock::runtime {

namespace {

uint32_t read_be32(std::string_view buf, size_t offset) {
  auto byte = [&](size_t i) {
    return static_cast<uint32_t>(static_cast<unsigned char>(buf[offset + i]));
  };
  return (byte(0) << 24) | (byte(1) << 16) | (byte(2) << 8) | byte(3);
}

void append_lines(std::vector<std::string> &out, std::string_view text) {
  auto lines = split_lines(text);
  out.insert(out.end(), std::make_move_iterator(lines.begin()),
             std::make_move_iterator(lines.end()));
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    bool blank = std::all_of(line.begin(), line.end(), [](char c) {
      return std::isspace(static_cast<unsigned char>(c));
    });
    if (!blank) {
      lines.emplace_back(line);
    }
    start = end + 1;
  }
  return lines;
}

std::vector<std::string> demultiplex_logs(std::string_view body) {
  std::vector<std::string> lines;
  size_t offset = 0;

  while (offset < body.size()) {
    size_t remaining = body.size() - offset;
    if (remaining < kLogFrameHeaderSize) {
      append_lines(lines, body.substr(offset));
      break;
    }

    auto stream = static_cast<unsigned char>(body[offset]);
    uint32_t length = read_be32(body, offset + 4);

    if (stream > static_cast<unsigned char>(LogStream::Stderr) ||
        length == 0 || length > remaining - kLogFrameHeaderSize) {
      spdlog::debug("Log frame header at offset {} rejected (stream={}, "
                    "length={}), reading remainder as text",
                    offset, stream, length);
      append_lines(lines, body.substr(offset));
      break;
    }

    offset += kLogFrameHeaderSize;
    append_lines(lines, body.substr(offset, length));
    offset += length;
  }

  if (lines.empty() && !body.empty()) {
    append_lines(lines, body);
  }
  return lines;
}

} // namespace dbdock::runtime
