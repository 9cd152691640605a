#pragma once
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/primitives.hpp>
#include <string_view>
#include <vector>

namespace waypoint::intent {

/// Coerce an un-typed numeric input to a uint256.
///
/// Negative values, non-numeric strings and values wider than 256 bits raise
/// `error_code::validation`; `field` names the offending input in the message.
waypoint::schema::uint256_t coerce_quantity(
    const waypoint::schema::quantity_t& quantity,
    const std::string_view& field);

/// keccak256(abi.encode(chain_id, calls, recent_block)).
waypoint::schema::hash32_t hash_chain_batch(
    const waypoint::schema::chain_batch_t& batch);

/// Coerce and hash each input, preserving order.
///
/// Pure and deterministic. An empty input list is rejected; an individual
/// batch may carry no calls.
waypoint::schema::chain_batches_t hash_chain_batches(
    const std::vector<waypoint::schema::chain_batch_input_t>& inputs);

/// Recompute the hash of a batch whose calls are present and compare it with
/// the committed one.
bool verify_chain_batch(const waypoint::schema::chain_batch_t& batch);

}  // namespace waypoint::intent
