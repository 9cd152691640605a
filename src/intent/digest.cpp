#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/encoding/abi/encoder.hpp>
#include <waypoint/intent/digest.hpp>

#include <algorithm>
#include <iterator>

namespace waypoint::intent {

waypoint::schema::hash32_t get_intent_hash(
    const waypoint::schema::chain_batches_t& batches) {
  if (batches.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "cannot digest an empty chain batch list");
  }

  auto hashes = std::vector<waypoint::schema::hash32_t>{};
  hashes.reserve(batches.size());
  std::transform(std::begin(batches), std::end(batches),
                 std::back_inserter(hashes),
                 [](const auto& batch) { return batch.hash; });

  auto enc = waypoint::encoding::encoder<
      waypoint::encoding::abi_encoder_tag>{};
  auto encoded = enc.encode(hashes);
  return waypoint::crypto::keccak256(
      waypoint::schema::make_bytes_view(encoded));
}

}  // namespace waypoint::intent
