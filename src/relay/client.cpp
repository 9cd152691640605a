#include <waypoint/common/error.hpp>
#include <waypoint/relay/client.hpp>
#include <waypoint/schema/json.hpp>

#include <spdlog/spdlog.h>

namespace waypoint::relay {

namespace {

std::string make_submit_url(std::string base_url) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  if (base_url.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "relay base URL is empty");
  }
  return base_url + std::string{kSubmitPath};
}

}  // namespace

client::client(std::shared_ptr<waypoint::net::http_client> http,
               std::string base_url)
    : http_{std::move(http)}, submit_url_{make_submit_url(std::move(base_url))} {}

boost::asio::awaitable<waypoint::schema::submit_response_t>
client::submit_transaction(const waypoint::schema::submit_request_t& request) {
  auto body = waypoint::schema::encode_json(request);
  spdlog::info("relay submit {} batches, {} authorizations",
               request.intent_authorization.chain_batches.size(),
               request.authorization.size());

  auto response = co_await http_->post(submit_url_, body);
  if (!response.ok()) {
    spdlog::error("relay rejected submission: HTTP {}", response.status);
    waypoint::common::raise(waypoint::common::error_code::transport,
                            "relay returned HTTP " +
                                std::to_string(response.status),
                            response.body);
  }

  auto submitted =
      waypoint::schema::decode_json<waypoint::schema::submit_response_t>(
          response.body);
  spdlog::info("relay accepted intent {} tx {}", submitted.intent_id,
               waypoint::schema::to_hex_prefixed(submitted.hash));
  co_return submitted;
}

}  // namespace waypoint::relay
