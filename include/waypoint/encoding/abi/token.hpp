#pragma once
#include <waypoint/schema/primitives.hpp>
#include <string_view>
#include <vector>

namespace waypoint::encoding::abi {

enum class token_kind : uint8_t {
  word = 0,   // uint256, address, bytes32 and other static 32-byte values
  bytes = 1,  // dynamic `bytes`
  tuple = 2,
  array = 3   // dynamic `T[]`
};

/// A value in the Solidity contract ABI type system.
///
/// Encoding follows the head/tail layout: static values are written in
/// place, dynamic values leave a 32-byte offset in the head and append their
/// body to the tail.
struct token final {
  token_kind kind{token_kind::word};
  waypoint::schema::hash32_t word{};
  waypoint::schema::bytes_t bytes;
  std::vector<token> children;

  bool dynamic() const;
};

using tokens_t = std::vector<token>;

token make_uint(const waypoint::schema::uint256_t& value);
token make_address(const waypoint::schema::address_t& value);
token make_bytes32(const waypoint::schema::hash32_t& value);
token make_bytes(const waypoint::schema::bytes_view_t& value);
token make_tuple(tokens_t children);
token make_array(tokens_t children);

/// abi.encode(params...).
waypoint::schema::bytes_t encode_parameters(const tokens_t& params);

/// selector(signature) || abi.encode(params...).
waypoint::schema::bytes_t encode_function_call(
    const std::string_view& signature,
    const tokens_t& params);

}  // namespace waypoint::encoding::abi
