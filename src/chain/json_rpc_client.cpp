#include <waypoint/chain/json_rpc_client.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/encoding/rlp/encoder.hpp>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <array>
#include <cctype>
#include <limits>
#include <string_view>

namespace waypoint::chain {

namespace {

// Percentage added on top of eth_estimateGas.
constexpr auto kGasMarginPercent = uint64_t{20};

constexpr auto kStaleNonceMessages =
    std::array{std::string_view{"nonce too low"},
               std::string_view{"invalid authorization nonce"},
               std::string_view{"nonce has already been used"}};

bool is_stale_nonce_message(std::string message) {
  std::transform(std::begin(message), std::end(message), std::begin(message),
                 [](unsigned char c) { return std::tolower(c); });
  return std::any_of(std::begin(kStaleNonceMessages),
                     std::end(kStaleNonceMessages), [&](const auto& needle) {
                       return message.find(needle) != std::string::npos;
                     });
}

uint64_t to_uint64(const waypoint::schema::uint256_t& value,
                   const std::string_view& what) {
  if (value > std::numeric_limits<uint64_t>::max()) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            std::string{what} + " does not fit in 64 bits");
  }
  return static_cast<uint64_t>(value);
}

const nlohmann::json& member(const nlohmann::json& object, const char* key) {
  if (!object.is_object() || !object.contains(key)) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "json-rpc object is missing " + std::string{key},
                            object.dump());
  }
  return object.at(key);
}

std::string string_value(const nlohmann::json& value,
                         const std::string_view& what) {
  if (!value.is_string()) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            std::string{what} + " is not a string",
                            value.dump());
  }
  return value.get<std::string>();
}

nlohmann::json authorization_list_json(
    const waypoint::schema::authorizations_t& authorizations) {
  auto list = nlohmann::json::array();
  for (const auto& authorization : authorizations) {
    list.push_back(
        {{"chainId", waypoint::schema::to_quantity(authorization.chain_id)},
         {"address", waypoint::schema::to_hex_prefixed(authorization.address)},
         {"nonce", waypoint::schema::to_quantity(authorization.nonce)},
         {"yParity", waypoint::schema::to_quantity(authorization.y_parity)},
         {"r", waypoint::schema::to_quantity(authorization.r)},
         {"s", waypoint::schema::to_quantity(authorization.s)}});
  }
  return list;
}

}  // namespace

nlohmann::json make_rpc_request(uint64_t id,
                                const std::string& method,
                                nlohmann::json params) {
  return nlohmann::json{{"jsonrpc", "2.0"},
                        {"id", id},
                        {"method", method},
                        {"params", std::move(params)}};
}

nlohmann::json rpc_result(const nlohmann::json& response) {
  if (!response.is_object()) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "json-rpc response is not an object",
                            response.dump());
  }
  if (response.contains("error") && !response.at("error").is_null()) {
    const auto& error = response.at("error");
    auto message = std::string{"unknown error"};
    auto code = int64_t{0};
    if (error.is_object()) {
      if (error.contains("message") && error.at("message").is_string()) {
        message = error.at("message").get<std::string>();
      }
      if (error.contains("code") && error.at("code").is_number_integer()) {
        code = error.at("code").get<int64_t>();
      }
    }
    auto text = "json-rpc error " + std::to_string(code) + ": " + message;
    if (is_stale_nonce_message(message)) {
      waypoint::common::raise(
          waypoint::common::error_code::stale_authorization, text,
          error.dump());
    }
    waypoint::common::raise(waypoint::common::error_code::rpc, text,
                            error.dump());
  }
  if (!response.contains("result")) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "json-rpc response has no result",
                            response.dump());
  }
  return response.at("result");
}

waypoint::schema::uint256_t parse_quantity(const nlohmann::json& value) {
  if (!value.is_string()) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "expected a hex quantity, got " + value.dump());
  }
  auto text = value.get<std::string>();
  auto parsed = text.rfind("0x", 0) == 0
                    ? waypoint::schema::try_parse_uint256(text)
                    : std::nullopt;
  if (!parsed) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "malformed hex quantity: " + text);
  }
  return *parsed;
}

waypoint::schema::transaction_receipt_t parse_receipt(
    const nlohmann::json& value) {
  auto hash = waypoint::schema::try_make_hash32(
      string_value(member(value, "transactionHash"), "transactionHash"));
  if (!hash) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "receipt carries a malformed transaction hash");
  }
  return waypoint::schema::transaction_receipt_t{
      .transaction_hash = *hash,
      .success = parse_quantity(member(value, "status")) == 1,
      .block_number = to_uint64(parse_quantity(member(value, "blockNumber")),
                                "blockNumber"),
      .gas_used =
          to_uint64(parse_quantity(member(value, "gasUsed")), "gasUsed")};
}

json_rpc_client::json_rpc_client(
    std::shared_ptr<waypoint::net::http_client> http,
    std::string url)
    : http_{std::move(http)}, url_{std::move(url)} {}

boost::asio::awaitable<nlohmann::json> json_rpc_client::call(
    const std::string& method,
    nlohmann::json params) {
  auto request = make_rpc_request(next_id_++, method, std::move(params));
  spdlog::trace("rpc {} -> {}", url_, method);
  auto response = co_await http_->post(url_, request.dump());
  if (!response.ok()) {
    waypoint::common::raise(waypoint::common::error_code::transport,
                            method + " returned HTTP " +
                                std::to_string(response.status),
                            response.body);
  }
  auto parsed = nlohmann::json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            method + " returned a non-JSON body",
                            response.body);
  }
  co_return rpc_result(parsed);
}

boost::asio::awaitable<waypoint::schema::chain_id_t>
json_rpc_client::chain_id() {
  if (!chain_id_) {
    chain_id_ = parse_quantity(co_await call("eth_chainId",
                                             nlohmann::json::array()));
  }
  co_return *chain_id_;
}

boost::asio::awaitable<waypoint::schema::block_number_t>
json_rpc_client::block_number() {
  co_return parse_quantity(
      co_await call("eth_blockNumber", nlohmann::json::array()));
}

boost::asio::awaitable<uint64_t> json_rpc_client::transaction_count(
    const waypoint::schema::address_t& address) {
  auto params = nlohmann::json::array(
      {waypoint::schema::to_hex_prefixed(address), "pending"});
  auto count = parse_quantity(
      co_await call("eth_getTransactionCount", std::move(params)));
  co_return to_uint64(count, "transaction count");
}

boost::asio::awaitable<waypoint::schema::hash32_t>
json_rpc_client::send_transaction(
    const waypoint::crypto::signer& sender,
    const waypoint::schema::transaction_request_t& request) {
  auto transaction = waypoint::schema::set_code_transaction_t{};
  transaction.chain_id = co_await chain_id();
  transaction.nonce = co_await transaction_count(sender.address());
  transaction.to = request.to;
  transaction.value = request.value;
  transaction.data = request.data;
  transaction.authorization_list = request.authorization_list;

  if (request.gas_limit) {
    transaction.gas_limit = *request.gas_limit;
  } else {
    auto params = nlohmann::json::array(
        {{{"from", waypoint::schema::to_hex_prefixed(sender.address())},
          {"to", waypoint::schema::to_hex_prefixed(request.to)},
          {"value", waypoint::schema::to_quantity(request.value)},
          {"data", waypoint::schema::to_hex_prefixed(request.data)},
          {"authorizationList",
           authorization_list_json(request.authorization_list)}}});
    auto estimate = parse_quantity(
        co_await call("eth_estimateGas", std::move(params)));
    transaction.gas_limit = to_uint64(
        estimate + (estimate * kGasMarginPercent) / 100, "gas limit");
  }

  if (request.max_priority_fee_per_gas) {
    transaction.max_priority_fee_per_gas = *request.max_priority_fee_per_gas;
  } else {
    transaction.max_priority_fee_per_gas = parse_quantity(
        co_await call("eth_maxPriorityFeePerGas", nlohmann::json::array()));
  }

  if (request.max_fee_per_gas) {
    transaction.max_fee_per_gas = *request.max_fee_per_gas;
  } else {
    auto params = nlohmann::json::array({"latest", false});
    auto block = co_await call("eth_getBlockByNumber", std::move(params));
    auto base_fee = block.is_object() && block.contains("baseFeePerGas")
                        ? parse_quantity(block.at("baseFeePerGas"))
                        : waypoint::schema::uint256_t{0};
    transaction.max_fee_per_gas =
        base_fee * 2 + transaction.max_priority_fee_per_gas;
  }

  auto preimage = waypoint::encoding::rlp::encode_for_signing(transaction);
  auto signature = sender.sign_hash(waypoint::crypto::keccak256(
      waypoint::schema::make_bytes_view(preimage)));
  transaction.y_parity = signature.y_parity;
  transaction.r = signature.r;
  transaction.s = signature.s;

  auto raw = waypoint::encoding::rlp::encode(transaction);
  spdlog::debug("chain {} sending type-4 transaction nonce={} gas={}",
                waypoint::schema::to_decimal(transaction.chain_id),
                transaction.nonce, transaction.gas_limit);
  auto params = nlohmann::json::array({waypoint::schema::to_hex_prefixed(raw)});
  auto result = co_await call("eth_sendRawTransaction", std::move(params));
  auto hash = result.is_string()
                  ? waypoint::schema::try_make_hash32(result.get<std::string>())
                  : std::nullopt;
  if (!hash) {
    waypoint::common::raise(waypoint::common::error_code::rpc,
                            "eth_sendRawTransaction returned " + result.dump());
  }
  co_return *hash;
}

boost::asio::awaitable<std::optional<waypoint::schema::transaction_receipt_t>>
json_rpc_client::receipt(const waypoint::schema::hash32_t& transaction_hash) {
  auto params = nlohmann::json::array(
      {waypoint::schema::to_hex_prefixed(transaction_hash)});
  auto result = co_await call("eth_getTransactionReceipt", std::move(params));
  if (result.is_null()) {
    co_return std::nullopt;
  }
  co_return parse_receipt(result);
}

boost::asio::awaitable<waypoint::schema::transaction_receipt_t>
json_rpc_client::wait_for_receipt(
    const waypoint::schema::hash32_t& transaction_hash,
    std::chrono::milliseconds poll_interval) {
  auto timer =
      boost::asio::steady_timer{co_await boost::asio::this_coro::executor};
  while (true) {
    auto found = co_await receipt(transaction_hash);
    if (found) {
      co_return *found;
    }
    timer.expires_after(poll_interval);
    co_await timer.async_wait(boost::asio::use_awaitable);
  }
}

}  // namespace waypoint::chain
