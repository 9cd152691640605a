#pragma once
#include <waypoint/schema/call.hpp>
#include <waypoint/schema/primitives.hpp>
#include <string>
#include <variant>
#include <vector>

namespace waypoint::schema {

// Numeric input that has not been coerced yet. Strings may be decimal or
// 0x-prefixed hex.
using quantity_t = std::variant<int64_t, uint64_t, uint256_t, std::string>;

template <uint16_t Version>
struct chain_batch_input;

template <>
struct chain_batch_input<1> final {
  constexpr static auto version = uint16_t{1};
  quantity_t chain_id;
  calls_t calls;
  quantity_t recent_block;
};

using chain_batch_input_t = chain_batch_input<1>;

template <uint16_t Version>
struct chain_batch;

template <>
struct chain_batch<1> final {
  constexpr static auto version = uint16_t{1};
  // keccak256(abi.encode(chain_id, calls, recent_block)), fixed at build time.
  hash32_t hash;
  chain_id_t chain_id;
  calls_t calls;
  block_number_t recent_block;

  bool operator==(const chain_batch<1>&) const = default;
};

using chain_batch_t = chain_batch<1>;
using chain_batches_t = std::vector<chain_batch_t>;

struct chain_selector_t final {
  chain_id_t chain_id;
};

}  // namespace waypoint::schema
