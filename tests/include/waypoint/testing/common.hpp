#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/net/http_client.hpp>
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/primitives.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace waypoint::testing {

// Well-known development accounts.
inline constexpr auto kUserKey = std::string_view{
    "0xac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80"};
inline constexpr auto kUserAddress =
    std::string_view{"0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266"};
inline constexpr auto kSolverKey = std::string_view{
    "0x59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d"};
inline constexpr auto kSolverAddress =
    std::string_view{"0x70997970c51812dc3a010c7d01b50e0d17dc79c8"};

inline constexpr auto kChainA = uint64_t{11155111};
inline constexpr auto kChainB = uint64_t{123420001114};

inline waypoint::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = waypoint::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline waypoint::schema::address_t make_address(const uint8_t fill) {
  auto out = waypoint::schema::address_t{};
  out.fill(fill);
  return out;
}

inline std::string hex(const waypoint::schema::bytes_view_t& bytes) {
  return waypoint::schema::to_hex(bytes);
}

// Two chains: A sends 100 wei to 0xaa..aa, B calls 0xbb..bb with 0x1234.
inline std::vector<waypoint::schema::chain_batch_input_t> make_two_chain_intent() {
  return {
      waypoint::schema::chain_batch_input_t{
          .chain_id = waypoint::schema::quantity_t{kChainA},
          .calls = {waypoint::schema::call_t{
              .to = make_address(0xaa), .value = 100, .data = {}}},
          .recent_block = waypoint::schema::quantity_t{uint64_t{10}}},
      waypoint::schema::chain_batch_input_t{
          .chain_id = waypoint::schema::quantity_t{kChainB},
          .calls = {waypoint::schema::call_t{
              .to = make_address(0xbb),
              .value = 0,
              .data = waypoint::schema::from_hex("0x1234")}},
          .recent_block = waypoint::schema::quantity_t{uint64_t{20}}}};
}

/// Run a coroutine to completion on a private io_context.
template <typename T>
T run(boost::asio::awaitable<T> task) {
  auto io = boost::asio::io_context{};
  auto future =
      boost::asio::co_spawn(io, std::move(task), boost::asio::use_future);
  io.run();
  return future.get();
}

/// Scripted chain. Heads are served in order and the last one repeats.
class fake_chain_client final : public waypoint::chain::client {
 public:
  explicit fake_chain_client(waypoint::schema::chain_id_t id) : id_{id} {}

  boost::asio::awaitable<waypoint::schema::chain_id_t> chain_id() override {
    co_return id_;
  }

  boost::asio::awaitable<waypoint::schema::block_number_t> block_number()
      override {
    ++block_number_calls;
    if (on_poll) {
      on_poll(block_number_calls);
    }
    if (heads.size() > 1) {
      auto head = heads.front();
      heads.pop_front();
      co_return head;
    }
    co_return heads.empty() ? waypoint::schema::block_number_t{0}
                            : heads.front();
  }

  boost::asio::awaitable<uint64_t> transaction_count(
      const waypoint::schema::address_t& address) override {
    auto it = nonces.find(address);
    co_return it == std::end(nonces) ? 0 : it->second;
  }

  boost::asio::awaitable<waypoint::schema::hash32_t> send_transaction(
      const waypoint::crypto::signer& sender,
      const waypoint::schema::transaction_request_t& request) override {
    sent.emplace_back(sender.address(), request);
    co_return waypoint::crypto::keccak256(
        waypoint::schema::make_bytes_view(request.data));
  }

  boost::asio::awaitable<waypoint::schema::transaction_receipt_t>
  wait_for_receipt(const waypoint::schema::hash32_t& transaction_hash,
                   std::chrono::milliseconds) override {
    if (on_receipt) {
      on_receipt();
    }
    co_return waypoint::schema::transaction_receipt_t{
        .transaction_hash = transaction_hash,
        .success = receipt_success,
        .block_number = 100,
        .gas_used = 21000};
  }

  std::deque<waypoint::schema::block_number_t> heads;
  std::map<waypoint::schema::address_t, uint64_t> nonces;
  bool receipt_success{true};
  std::size_t block_number_calls{0};
  std::function<void(std::size_t)> on_poll;
  // Runs before a receipt is returned; may throw.
  std::function<void()> on_receipt;
  std::vector<std::pair<waypoint::schema::address_t,
                        waypoint::schema::transaction_request_t>>
      sent;

 private:
  waypoint::schema::chain_id_t id_;
};

/// Records requests. Queued responses are served first, then `response`
/// repeats.
class fake_http_client final : public waypoint::net::http_client {
 public:
  boost::asio::awaitable<waypoint::net::http_response_t> post(
      const std::string& url,
      const std::string& body) override {
    requests.emplace_back(url, body);
    if (!queued.empty()) {
      auto next = std::move(queued.front());
      queued.pop_front();
      co_return next;
    }
    co_return response;
  }

  /// Queue a JSON-RPC success response carrying `result`.
  void queue_result(const std::string& result_json) {
    queued.push_back(waypoint::net::http_response_t{
        .status = 200,
        .body = R"({"jsonrpc":"2.0","id":1,"result":)" + result_json + "}"});
  }

  waypoint::net::http_response_t response{.status = 200, .body = "{}"};
  std::deque<waypoint::net::http_response_t> queued;
  std::vector<std::pair<std::string, std::string>> requests;
};

}  // namespace waypoint::testing
