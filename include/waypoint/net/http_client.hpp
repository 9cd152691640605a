#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace waypoint::net {

struct url_t final {
  std::string scheme;
  std::string host;
  std::string port;
  std::string target;

  bool tls() const { return scheme == "https"; }
};

/// Split an http(s) URL. Raises error_code::validation on anything else.
url_t parse_url(const std::string_view& url);

struct http_response_t final {
  unsigned status{};
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

class http_client {
 public:
  virtual ~http_client() = default;

  /// Connection and protocol failures raise error_code::transport. Non-2xx
  /// responses are returned as-is.
  virtual boost::asio::awaitable<http_response_t> post(
      const std::string& url,
      const std::string& body) = 0;
};

/// One connection per request over Boost.Beast, TLS for https URLs.
class beast_http_client final : public http_client {
 public:
  explicit beast_http_client(
      std::chrono::milliseconds timeout = std::chrono::seconds{30});

  boost::asio::awaitable<http_response_t> post(const std::string& url,
                                               const std::string& body) override;

 private:
  boost::asio::ssl::context ssl_context_;
  std::chrono::milliseconds timeout_;
};

}  // namespace waypoint::net
