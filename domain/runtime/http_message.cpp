#include "http_message.hpp"

#include <fmt/format.h>

namespace dbdock::runtime {

std::string HttpRequest::frame() const {
  std::string out;
  out.reserve(256 + body.size());

  fmt::format_to(std::back_inserter(out), "{} {} HTTP/1.1\r\n", method,
                 target);
  out += "Host: podman\r\n";
  out += "Connection: close\r\n";
  out += "User-Agent: dbdock/1.0\r\n";

  for (const auto &[name, value] : headers) {
    fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, value);
  }
  fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n",
                 body.size());

  out += "\r\n";
  out += body;
  return out;
}

} // namespace dbdock::runtime
