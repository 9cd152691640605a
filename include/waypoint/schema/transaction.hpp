#pragma once
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/primitives.hpp>
#include <optional>

namespace waypoint::schema {

// Contract write handed to a chain client; fee and gas fields are filled in
// by the client when absent.
struct transaction_request_t final {
  address_t to;
  uint256_t value;
  bytes_t data;
  authorizations_t authorization_list;
  std::optional<uint64_t> gas_limit;
  std::optional<uint256_t> max_fee_per_gas;
  std::optional<uint256_t> max_priority_fee_per_gas;
};

template <uint16_t Version>
struct set_code_transaction;

// EIP-7702 (type 0x04) transaction.
template <>
struct set_code_transaction<1> final {
  constexpr static auto version = uint16_t{1};
  constexpr static auto type = uint8_t{0x04};
  chain_id_t chain_id;
  uint64_t nonce{};
  uint256_t max_priority_fee_per_gas;
  uint256_t max_fee_per_gas;
  uint64_t gas_limit{};
  address_t to;
  uint256_t value;
  bytes_t data;
  authorizations_t authorization_list;
  uint8_t y_parity{};
  uint256_t r;
  uint256_t s;
};

using set_code_transaction_t = set_code_transaction<1>;

template <uint16_t Version>
struct transaction_receipt;

template <>
struct transaction_receipt<1> final {
  constexpr static auto version = uint16_t{1};
  hash32_t transaction_hash;
  bool success{};
  uint64_t block_number{};
  uint64_t gas_used{};
};

using transaction_receipt_t = transaction_receipt<1>;

}  // namespace waypoint::schema
