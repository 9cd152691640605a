#include <waypoint/intent/disclosure.hpp>

#include <algorithm>
#include <iterator>

namespace waypoint::intent {

waypoint::schema::chain_batches_t select_chain_for_chain_batches(
    const waypoint::schema::chain_batches_t& batches,
    const waypoint::schema::chain_selector_t& selector) {
  auto disclosed = waypoint::schema::chain_batches_t{};
  disclosed.reserve(batches.size());
  for (const auto& batch : batches) {
    if (batch.chain_id == selector.chain_id) {
      disclosed.push_back(batch);
      continue;
    }
    disclosed.push_back(waypoint::schema::chain_batch_t{
        .hash = batch.hash,
        .chain_id = batch.chain_id,
        .calls = {},
        .recent_block = batch.recent_block});
  }
  return disclosed;
}

waypoint::schema::chain_batches_t batches_for_chain(
    const waypoint::schema::chain_batches_t& batches,
    const waypoint::schema::chain_id_t& chain_id) {
  auto selected = waypoint::schema::chain_batches_t{};
  std::copy_if(std::begin(batches), std::end(batches),
               std::back_inserter(selected),
               [&](const auto& batch) { return batch.chain_id == chain_id; });
  return selected;
}

std::vector<waypoint::schema::chain_id_t> distinct_chains(
    const waypoint::schema::chain_batches_t& batches) {
  auto chains = std::vector<waypoint::schema::chain_id_t>{};
  for (const auto& batch : batches) {
    if (std::find(std::begin(chains), std::end(chains), batch.chain_id) ==
        std::end(chains)) {
      chains.push_back(batch.chain_id);
    }
  }
  return chains;
}

}  // namespace waypoint::intent
