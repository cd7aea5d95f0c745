#ifndef DBDOCK_RUNTIME_FAKE_TRANSPORT_HPP
#define DBDOCK_RUNTIME_FAKE_TRANSPORT_HPP

#include "transport.hpp"

#include <fmt/format.h>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

// Test double: answers requests from an ordered rule list instead of a
// socket and records every request it sees.
namespace dbdock::runtime::fakes {

inline std::string http_reply(int status, std::string_view body,
                              std::string_view content_type =
                                  "application/json") {
  return fmt::format("HTTP/1.1 {} Fake\r\n"
                     "Content-Type: {}\r\n"
                     "Content-Length: {}\r\n"
                     "\r\n"
                     "{}",
                     status, content_type, body.size(), body);
}

class FakeTransport final : public ITransport {
public:
  using Handler = std::function<GatewayResult<std::string>(const HttpRequest &)>;

  // Later rules win over earlier ones with an overlapping match.
  void on(std::string method, std::string fragment, Handler handler) {
    rules_.push_back({std::move(method), std::move(fragment),
                      std::move(handler)});
  }

  void reply(std::string method, std::string fragment, int status,
             std::string body,
             std::string content_type = "application/json") {
    auto raw = http_reply(status, body, content_type);
    on(std::move(method), std::move(fragment),
       [raw](const HttpRequest &) { return GatewayResult<std::string>::Ok(raw); });
  }

  void fail(std::string method, std::string fragment, GatewayError error) {
    on(std::move(method), std::move(fragment), [error](const HttpRequest &) {
      return GatewayResult<std::string>::Error(error);
    });
  }

  GatewayResult<std::string> round_trip(const RuntimeEndpoint &,
                                        const HttpRequest &request) override {
    requests_.push_back(request);
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
      if (it->method == request.method &&
          request.target.find(it->fragment) != std::string::npos) {
        return it->handler(request);
      }
    }
    return GatewayResult<std::string>::Ok(
        http_reply(404, R"({"message":"no such route"})"));
  }

  const std::vector<HttpRequest> &requests() const { return requests_; }

  size_t count(std::string_view method, std::string_view fragment) const {
    size_t n = 0;
    for (const auto &request : requests_) {
      if (request.method == method &&
          request.target.find(fragment) != std::string::npos) {
        ++n;
      }
    }
    return n;
  }

private:
  struct Rule {
    std::string method;
    std::string fragment;
    Handler handler;
  };

  std::vector<Rule> rules_;
  std::vector<HttpRequest> requests_;
};

} // namespace dbdock::runtime::fakes

#endif // DBDOCK_RUNTIME_FAKE_TRANSPORT_HPP
