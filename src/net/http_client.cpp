#include <waypoint/common/error.hpp>
#include <waypoint/net/http_client.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace waypoint::net {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

http::request<http::string_body> make_request(const url_t& url,
                                              const std::string& body) {
  auto request = http::request<http::string_body>{http::verb::post,
                                                  url.target, 11};
  request.set(http::field::host, url.host);
  request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  request.set(http::field::content_type, "application/json");
  request.set(http::field::accept, "application/json");
  request.body() = body;
  request.prepare_payload();
  return request;
}

template <typename Stream>
asio::awaitable<http_response_t> exchange(
    Stream& stream,
    const http::request<http::string_body>& request) {
  co_await http::async_write(stream, request, asio::use_awaitable);
  auto buffer = beast::flat_buffer{};
  auto response = http::response<http::string_body>{};
  co_await http::async_read(stream, buffer, response, asio::use_awaitable);
  co_return http_response_t{.status = response.result_int(),
                            .body = std::move(response.body())};
}

}  // namespace

url_t parse_url(const std::string_view& url) {
  auto separator = url.find("://");
  if (separator == std::string_view::npos) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "URL has no scheme: " + std::string{url});
  }
  auto parsed = url_t{};
  parsed.scheme = std::string{url.substr(0, separator)};
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "unsupported URL scheme: " + parsed.scheme);
  }

  auto rest = url.substr(separator + 3);
  auto path = rest.find('/');
  auto authority = rest.substr(0, path);
  parsed.target =
      path == std::string_view::npos ? "/" : std::string{rest.substr(path)};

  auto colon = authority.rfind(':');
  if (colon == std::string_view::npos) {
    parsed.host = std::string{authority};
    parsed.port = parsed.tls() ? "443" : "80";
  } else {
    parsed.host = std::string{authority.substr(0, colon)};
    parsed.port = std::string{authority.substr(colon + 1)};
  }
  if (parsed.host.empty() || parsed.port.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "URL has no host: " + std::string{url});
  }
  return parsed;
}

beast_http_client::beast_http_client(std::chrono::milliseconds timeout)
    : ssl_context_{asio::ssl::context::tls_client}, timeout_{timeout} {
  ssl_context_.set_default_verify_paths();
  ssl_context_.set_verify_mode(asio::ssl::verify_peer);
}

asio::awaitable<http_response_t> beast_http_client::post(
    const std::string& url,
    const std::string& body) {
  auto parsed = parse_url(url);
  auto request = make_request(parsed, body);
  auto executor = co_await asio::this_coro::executor;

  try {
    auto resolver = tcp::resolver{executor};
    auto endpoints = co_await resolver.async_resolve(parsed.host, parsed.port,
                                                     asio::use_awaitable);

    if (!parsed.tls()) {
      auto stream = beast::tcp_stream{executor};
      stream.expires_after(timeout_);
      co_await stream.async_connect(endpoints, asio::use_awaitable);
      auto response = co_await waypoint::net::exchange(stream, request);
      auto ec = beast::error_code{};
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        spdlog::debug("http shutdown {}: {}", parsed.host, ec.message());
      }
      co_return response;
    }

    auto stream = beast::ssl_stream<beast::tcp_stream>{executor, ssl_context_};
    if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                  parsed.host.c_str())) {
      waypoint::common::raise(waypoint::common::error_code::transport,
                              "failed to set TLS SNI for " + parsed.host);
    }
    beast::get_lowest_layer(stream).expires_after(timeout_);
    co_await beast::get_lowest_layer(stream).async_connect(endpoints,
                                                           asio::use_awaitable);
    co_await stream.async_handshake(asio::ssl::stream_base::client,
                                    asio::use_awaitable);
    auto response = co_await waypoint::net::exchange(stream, request);
    auto ec = beast::error_code{};
    co_await stream.async_shutdown(asio::redirect_error(asio::use_awaitable, ec));
    if (ec && ec != asio::ssl::error::stream_truncated) {
      spdlog::debug("tls shutdown {}: {}", parsed.host, ec.message());
    }
    co_return response;
  } catch (const boost::system::system_error& e) {
    waypoint::common::raise(waypoint::common::error_code::transport,
                            "POST " + url + " failed: " + e.what());
  }
}

}  // namespace waypoint::net
