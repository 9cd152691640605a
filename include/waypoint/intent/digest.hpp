#pragma once
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/primitives.hpp>

namespace waypoint::intent {

// keccak256(abi.encode(bytes32[] hashes)) over the batch hashes in order.
// Raises error_code::validation for an empty list.
waypoint::schema::hash32_t get_intent_hash(
    const waypoint::schema::chain_batches_t& batches);

}  // namespace waypoint::intent
