#ifndef DBDOCK_RUNTIME_HTTP_MESSAGE_HPP
#define DBDOCK_RUNTIME_HTTP_MESSAGE_HPP

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace dbdock::runtime {

struct HttpRequest {
  std::string method;
  // Absolute path including the query string.
  std::string target;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  // One text+body blob: request line, fixed headers, caller headers,
  // Content-Length, blank line, body.
  std::string frame() const;
};

struct RawResponse {
  int status_code = 0;
  std::string status_text;
  // Lower-cased, trimmed names; values keep their casing.
  std::map<std::string, std::string> headers;
  std::string body;

  bool ok() const { return status_code >= 200 && status_code < 300; }

  std::string header(const std::string &name) const {
    auto it = headers.find(name);
    return it == headers.end() ? std::string{} : it->second;
  }
};

} // namespace dbdock::runtime

#endif // DBDOCK_RUNTIME_HTTP_MESSAGE_HPP
