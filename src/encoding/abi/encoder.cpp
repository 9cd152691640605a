#include <waypoint/encoding/abi/encoder.hpp>

#include <algorithm>
#include <iterator>

namespace waypoint::encoding::abi {

token to_token(const waypoint::schema::call_t& call) {
  return make_tuple({make_address(call.to), make_uint(call.value),
                     make_bytes(waypoint::schema::make_bytes_view(call.data))});
}

token to_token(const waypoint::schema::calls_t& calls) {
  auto children = tokens_t{};
  children.reserve(calls.size());
  std::transform(std::begin(calls), std::end(calls),
                 std::back_inserter(children),
                 [](const auto& call) { return to_token(call); });
  return make_array(std::move(children));
}

token to_token(const waypoint::schema::chain_batch_t& batch) {
  return make_tuple({make_bytes32(batch.hash), make_uint(batch.chain_id),
                     to_token(batch.calls), make_uint(batch.recent_block)});
}

token to_token(const waypoint::schema::intent_authorization_t& intent) {
  auto batches = tokens_t{};
  batches.reserve(intent.chain_batches.size());
  for (const auto& batch : intent.chain_batches) {
    batches.push_back(to_token(batch));
  }
  return make_tuple(
      {make_bytes(waypoint::schema::make_bytes_view(intent.signature)),
       make_array(std::move(batches))});
}

tokens_t parameters(const waypoint::schema::chain_batch_t& batch) {
  return {make_uint(batch.chain_id), to_token(batch.calls),
          make_uint(batch.recent_block)};
}

tokens_t parameters(const std::vector<waypoint::schema::hash32_t>& hashes) {
  auto children = tokens_t{};
  children.reserve(hashes.size());
  for (const auto& hash : hashes) {
    children.push_back(make_bytes32(hash));
  }
  return {make_array(std::move(children))};
}

tokens_t parameters(const waypoint::schema::calls_t& calls) {
  return {to_token(calls)};
}

tokens_t parameters(const waypoint::schema::intent_authorization_t& intent) {
  return {to_token(intent)};
}

waypoint::schema::bytes_t encode_execute(
    const waypoint::schema::intent_authorization_t& intent) {
  return encode_function_call(kExecuteSignature, parameters(intent));
}

waypoint::schema::bytes_t encode_self_execute(
    const waypoint::schema::calls_t& calls) {
  return encode_function_call(kSelfExecuteSignature, parameters(calls));
}

}  // namespace waypoint::encoding::abi
