#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/encoding/abi/encoder.hpp>
#include <waypoint/intent/builder.hpp>

#include <string>

namespace waypoint::intent {

waypoint::schema::uint256_t coerce_quantity(
    const waypoint::schema::quantity_t& quantity,
    const std::string_view& field) {
  return std::visit(
      overloaded{
          [&](const int64_t value) -> waypoint::schema::uint256_t {
            if (value < 0) {
              waypoint::common::raise(
                  waypoint::common::error_code::validation,
                  std::string{field} + " must be non-negative, got " +
                      std::to_string(value));
            }
            return waypoint::schema::uint256_t{value};
          },
          [](const uint64_t value) -> waypoint::schema::uint256_t {
            return waypoint::schema::uint256_t{value};
          },
          [](const waypoint::schema::uint256_t& value)
              -> waypoint::schema::uint256_t { return value; },
          [&](const std::string& value) -> waypoint::schema::uint256_t {
            auto parsed = waypoint::schema::try_parse_uint256(value);
            if (!parsed) {
              waypoint::common::raise(
                  waypoint::common::error_code::validation,
                  std::string{field} + " is not a uint256: '" + value + "'");
            }
            return *parsed;
          }},
      quantity);
}

waypoint::schema::hash32_t hash_chain_batch(
    const waypoint::schema::chain_batch_t& batch) {
  auto enc = waypoint::encoding::encoder<
      waypoint::encoding::abi_encoder_tag>{};
  auto preimage = enc.encode(batch);
  return waypoint::crypto::keccak256(
      waypoint::schema::make_bytes_view(preimage));
}

waypoint::schema::chain_batches_t hash_chain_batches(
    const std::vector<waypoint::schema::chain_batch_input_t>& inputs) {
  if (inputs.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "an intent needs at least one chain batch");
  }

  auto batches = waypoint::schema::chain_batches_t{};
  batches.reserve(inputs.size());
  for (const auto& input : inputs) {
    auto batch = waypoint::schema::chain_batch_t{
        .hash = waypoint::schema::make_zero_hash(),
        .chain_id = coerce_quantity(input.chain_id, "chainId"),
        .calls = input.calls,
        .recent_block = coerce_quantity(input.recent_block, "recentBlock")};
    batch.hash = hash_chain_batch(batch);
    batches.push_back(std::move(batch));
  }
  return batches;
}

bool verify_chain_batch(const waypoint::schema::chain_batch_t& batch) {
  return hash_chain_batch(batch) == batch.hash;
}

}  // namespace waypoint::intent
