#include "decoder.hpp"

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/regex.hpp>
#include <charconv>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace dbdock::runtime {

namespace {

const boost::regex &status_line_pattern() {
  static const boost::regex pattern(R"(^HTTP/1\.(\d) (\d{3})(?: (.*))?$)");
  return pattern;
}

struct Split {
  std::string_view head;
  std::string_view body;
};

// First blank line, CRLF or LF flavoured.
Split split_head(std::string_view raw) {
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\n') {
      continue;
    }
    size_t head_end = (i > 0 && raw[i - 1] == '\r') ? i - 1 : i;
    if (i + 1 < raw.size() && raw[i + 1] == '\n') {
      return {raw.substr(0, head_end), raw.substr(i + 2)};
    }
    if (i + 2 < raw.size() && raw[i + 1] == '\r' && raw[i + 2] == '\n') {
      return {raw.substr(0, head_end), raw.substr(i + 3)};
    }
  }
  return {raw, std::string_view{}};
}

std::string_view next_line(std::string_view &rest) {
  auto pos = rest.find('\n');
  std::string_view line = rest.substr(0, pos);
  rest = pos == std::string_view::npos ? std::string_view{}
                                       : rest.substr(pos + 1);
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

std::string_view trim_view(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

bool is_dropped_c0(unsigned char c, bool keep_whitespace) {
  if (c == 0x7F) {
    return true;
  }
  if (c >= 0x20) {
    return false;
  }
  if (keep_whitespace && (c == '\t' || c == '\n' || c == '\r')) {
    return false;
  }
  return true;
}

size_t utf8_sequence_length(std::string_view s, size_t i) {
  auto lead = static_cast<unsigned char>(s[i]);
  size_t len = 0;
  if (lead >= 0xC2 && lead <= 0xDF) {
    len = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    len = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    len = 4;
  } else {
    return 0;
  }
  if (i + len > s.size()) {
    return 0;
  }
  for (size_t k = 1; k < len; ++k) {
    auto c = static_cast<unsigned char>(s[i + k]);
    if ((c & 0xC0) != 0x80) {
      return 0;
    }
  }
  return len;
}

std::string strip_controls(std::string_view in, bool keep_whitespace) {
  std::string out;
  out.reserve(in.size());

  for (size_t i = 0; i < in.size();) {
    auto c = static_cast<unsigned char>(in[i]);

    if (c < 0x80) {
      if (!is_dropped_c0(c, keep_whitespace)) {
        out.push_back(static_cast<char>(c));
      }
      ++i;
      continue;
    }

    size_t len = utf8_sequence_length(in, i);
    if (len == 0) {
      // Stray byte: raw C1 range goes, everything else stays.
      if (c > 0x9F) {
        out.push_back(static_cast<char>(c));
      }
      ++i;
      continue;
    }

    bool encoded_c1 = len == 2 && c == 0xC2 &&
                      static_cast<unsigned char>(in[i + 1]) <= 0x9F;
    if (!encoded_c1) {
      out.append(in.substr(i, len));
    }
    i += len;
  }
  return out;
}

std::string normalize_line_endings(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < in.size() && in[i + 1] == '\n') {
        ++i;
      }
    } else {
      out.push_back(in[i]);
    }
  }
  return out;
}

} // namespace

std::string dechunk(std::string_view body) {
  std::string out;
  out.reserve(body.size());
  std::string_view rest = body;

  while (!rest.empty()) {
    std::string_view size_line = next_line(rest);
    auto ext = size_line.find(';');
    std::string_view digits = trim_view(size_line.substr(0, ext));

    size_t size = 0;
    auto [ptr, ec] =
        std::from_chars(digits.data(), digits.data() + digits.size(), size, 16);
    if (digits.empty() || ec != std::errc{} ||
        ptr != digits.data() + digits.size()) {
      spdlog::debug("Chunk size line '{}' is not hex, keeping remainder",
                    size_line);
      out.append(size_line);
      if (!rest.empty()) {
        out.push_back('\n');
        out.append(rest);
      }
      break;
    }

    if (size == 0) {
      break;
    }

    size = std::min(size, rest.size());
    out.append(rest.substr(0, size));
    rest.remove_prefix(size);

    if (rest.starts_with("\r\n")) {
      rest.remove_prefix(2);
    } else if (rest.starts_with("\n")) {
      rest.remove_prefix(1);
    }
  }
  return out;
}

std::string sanitize_text(std::string_view body) {
  auto cleaned = normalize_line_endings(strip_controls(body, true));
  boost::algorithm::trim(cleaned);
  return cleaned;
}

std::string sanitize_for_json(std::string_view body) {
  auto cleaned = boost::algorithm::erase_all_copy(std::string(body),
                                                  "\\u0000");
  cleaned = strip_controls(cleaned, false);
  boost::algorithm::trim(cleaned);
  return cleaned;
}

GatewayResult<RawResponse> decode_response(std::string_view raw,
                                           BodyMode mode) {
  using Out = GatewayResult<RawResponse>;

  if (raw.empty()) {
    return Out::Error(GatewayError::decode("empty response from runtime"));
  }

  auto [head, body] = split_head(raw);
  std::string_view head_rest = head;
  std::string status_line(next_line(head_rest));

  boost::smatch match;
  if (!boost::regex_match(status_line, match, status_line_pattern())) {
    spdlog::error("Raw response data: {}",
                  std::string_view(raw).substr(0, 200));
    return Out::Error(GatewayError::decode(
        fmt::format("invalid HTTP response from runtime socket: '{}'",
                    status_line.substr(0, 80))));
  }

  RawResponse response;
  response.status_code = std::stoi(match[2].str());
  response.status_text = match[3].matched ? match[3].str() : std::string{};

  while (!head_rest.empty()) {
    std::string_view line = next_line(head_rest);
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      continue;
    }
    std::string name(line.substr(0, colon));
    boost::algorithm::trim(name);
    boost::algorithm::to_lower(name);
    std::string value(line.substr(colon + 1));
    boost::algorithm::trim(value);
    if (!name.empty()) {
      response.headers[name] = std::move(value);
    }
  }

  std::string decoded_body;
  if (boost::algorithm::icontains(response.header("transfer-encoding"),
                                  "chunked")) {
    decoded_body = dechunk(body);
  } else {
    decoded_body = std::string(body);
  }

  response.body = mode == BodyMode::Text ? sanitize_text(decoded_body)
                                         : std::move(decoded_body);
  return Out::Ok(std::move(response));
}

} // namespace dbdock::runtime
