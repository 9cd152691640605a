#pragma once
#include <waypoint/schema/chain_batch.hpp>

#include <vector>

namespace waypoint::intent {

// Copy of `batches` where only the selected chain keeps its calls. Hashes,
// chain ids and watermarks are untouched, so the intent digest is unchanged.
waypoint::schema::chain_batches_t select_chain_for_chain_batches(
    const waypoint::schema::chain_batches_t& batches,
    const waypoint::schema::chain_selector_t& selector);

// Batches of `batches` that belong to `chain_id`, in order.
waypoint::schema::chain_batches_t batches_for_chain(
    const waypoint::schema::chain_batches_t& batches,
    const waypoint::schema::chain_id_t& chain_id);

// Chain ids in first-seen order, without repeats.
std::vector<waypoint::schema::chain_id_t> distinct_chains(
    const waypoint::schema::chain_batches_t& batches);

}  // namespace waypoint::intent
