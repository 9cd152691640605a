#include <gtest/gtest.h>
#include <waypoint/common/error.hpp>
#include <waypoint/intent/builder.hpp>
#include <waypoint/relay/client.hpp>
#include <waypoint/schema/json.hpp>
#include <waypoint/testing/common.hpp>

#include <memory>

namespace {

waypoint::schema::submit_request_t make_request() {
  return waypoint::schema::submit_request_t{
      .authorization = {waypoint::schema::authorization_t{
          .address = waypoint::testing::make_address(0xde),
          .chain_id = waypoint::testing::kChainB,
          .nonce = 2,
          .y_parity = 0,
          .r = 5,
          .s = 6}},
      .intent_authorization = waypoint::schema::intent_authorization_t{
          .signature = waypoint::schema::bytes_t(65, 0x11),
          .chain_batches = waypoint::intent::hash_chain_batches(
              waypoint::testing::make_two_chain_intent())}};
}

}  // namespace

TEST(relay_client, trims_trailing_slashes_from_base_url) {
  auto http = std::make_shared<waypoint::testing::fake_http_client>();
  auto relay = waypoint::relay::client{http, "https://relay.example/api//"};
  EXPECT_EQ(relay.submit_url(), "https://relay.example/api/transaction/submit");
  EXPECT_THROW((waypoint::relay::client{http, "/"}), waypoint::common::error);
}

TEST(relay_client, posts_request_and_parses_response) {
  auto http = std::make_shared<waypoint::testing::fake_http_client>();
  http->response = waypoint::net::http_response_t{
      .status = 200,
      .body = R"({"hash": "0x0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20",
                  "intentId": "abc"})"};
  auto relay = waypoint::relay::client{http, "https://relay.example"};

  auto response =
      waypoint::testing::run(relay.submit_transaction(make_request()));
  EXPECT_EQ(response.intent_id, "abc");
  EXPECT_EQ(response.hash, waypoint::testing::make_hash(0x01));

  ASSERT_EQ(http->requests.size(), 1u);
  EXPECT_EQ(http->requests[0].first,
            "https://relay.example/transaction/submit");
  auto body = nlohmann::json::parse(http->requests[0].second);
  EXPECT_EQ(body.at("authorization")[0].at("chainId").get<std::string>(),
            "123420001114");
  EXPECT_EQ(body.at("authorization")[0].at("r").get<std::string>(), "5");
  EXPECT_EQ(body.at("intentAuthorization")
                .at("chainBatches")[1]
                .at("recentBlock")
                .get<std::string>(),
            "20");
}

TEST(relay_client, non_success_status_raises_with_body) {
  auto http = std::make_shared<waypoint::testing::fake_http_client>();
  http->response = waypoint::net::http_response_t{
      .status = 422, .body = R"({"error":"stale nonce"})"};
  auto relay = waypoint::relay::client{http, "https://relay.example"};

  try {
    waypoint::testing::run(relay.submit_transaction(make_request()));
    FAIL() << "expected a transport error";
  } catch (const waypoint::common::error& e) {
    EXPECT_EQ(e.code(), waypoint::common::error_code::transport);
    EXPECT_NE(std::string{e.what()}.find("422"), std::string::npos);
    EXPECT_EQ(e.detail(), R"({"error":"stale nonce"})");
  }
  EXPECT_EQ(http->requests.size(), 1u);
}

TEST(relay_client, malformed_response_is_a_validation_error) {
  auto http = std::make_shared<waypoint::testing::fake_http_client>();
  http->response = waypoint::net::http_response_t{.status = 201, .body = "{}"};
  auto relay = waypoint::relay::client{http, "https://relay.example"};

  try {
    waypoint::testing::run(relay.submit_transaction(make_request()));
    FAIL() << "expected a validation error";
  } catch (const waypoint::common::error& e) {
    EXPECT_EQ(e.code(), waypoint::common::error_code::validation);
  }
}
