#pragma once

#include <waypoint/net/http_client.hpp>
#include <waypoint/schema/relay.hpp>

#include <boost/asio/awaitable.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace waypoint::relay {

inline constexpr auto kSubmitPath = std::string_view{"/transaction/submit"};

/// Hands a signed intent package to a relayer that executes it on the
/// user's behalf.
class client final {
 public:
  client(std::shared_ptr<waypoint::net::http_client> http,
         std::string base_url);

  /// POST {base_url}/transaction/submit. A non-2xx status raises
  /// error_code::transport with the response body attached. No retry.
  boost::asio::awaitable<waypoint::schema::submit_response_t>
  submit_transaction(const waypoint::schema::submit_request_t& request);

  const std::string& submit_url() const { return submit_url_; }

 private:
  std::shared_ptr<waypoint::net::http_client> http_;
  std::string submit_url_;
};

}  // namespace waypoint::relay
