#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/net/http_client.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace waypoint::chain {

/// Ethereum JSON-RPC over HTTP. Contract writes are sent as signed EIP-7702
/// (type 0x04) transactions.
class json_rpc_client final : public client {
 public:
  json_rpc_client(std::shared_ptr<waypoint::net::http_client> http,
                  std::string url);

  boost::asio::awaitable<waypoint::schema::chain_id_t> chain_id() override;
  boost::asio::awaitable<waypoint::schema::block_number_t> block_number()
      override;
  boost::asio::awaitable<uint64_t> transaction_count(
      const waypoint::schema::address_t& address) override;
  boost::asio::awaitable<waypoint::schema::hash32_t> send_transaction(
      const waypoint::crypto::signer& sender,
      const waypoint::schema::transaction_request_t& request) override;
  boost::asio::awaitable<waypoint::schema::transaction_receipt_t>
  wait_for_receipt(const waypoint::schema::hash32_t& transaction_hash,
                   std::chrono::milliseconds poll_interval) override;

  /// Raw call. JSON-RPC error objects raise error_code::rpc, or
  /// error_code::stale_authorization for nonce rejections.
  boost::asio::awaitable<nlohmann::json> call(const std::string& method,
                                              nlohmann::json params);

 private:
  boost::asio::awaitable<std::optional<waypoint::schema::transaction_receipt_t>>
  receipt(const waypoint::schema::hash32_t& transaction_hash);

  std::shared_ptr<waypoint::net::http_client> http_;
  std::string url_;
  std::optional<waypoint::schema::chain_id_t> chain_id_;
  std::atomic<uint64_t> next_id_{1};
};

// Helpers shared with tests.
nlohmann::json make_rpc_request(uint64_t id,
                                const std::string& method,
                                nlohmann::json params);
/// Result member of a response; raises on an error member.
nlohmann::json rpc_result(const nlohmann::json& response);
waypoint::schema::uint256_t parse_quantity(const nlohmann::json& value);
waypoint::schema::transaction_receipt_t parse_receipt(
    const nlohmann::json& value);

}  // namespace waypoint::chain
