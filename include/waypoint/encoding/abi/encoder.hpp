#pragma once
#include <waypoint/encoding/abi/token.hpp>
#include <waypoint/encoding/encoder.hpp>
#include <waypoint/schema/call.hpp>
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/intent_authorization.hpp>
#include <iterator>
#include <string_view>

namespace waypoint::encoding {

namespace abi {

inline constexpr auto kCallType = std::string_view{"(address,uint256,bytes)"};
inline constexpr auto kExecuteSignature = std::string_view{
    "execute((bytes,(bytes32,uint256,(address,uint256,bytes)[],uint256)[]))"};
inline constexpr auto kSelfExecuteSignature =
    std::string_view{"selfExecute((address,uint256,bytes)[])"};

token to_token(const waypoint::schema::call_t& call);
token to_token(const waypoint::schema::calls_t& calls);
// (bytes32 hash, uint256 chainId, Call[] calls, uint256 recentBlock)
token to_token(const waypoint::schema::chain_batch_t& batch);
// (bytes signature, ChainBatch[] chainBatches)
token to_token(const waypoint::schema::intent_authorization_t& intent);

// A chain batch is committed to as (uint256 chainId, Call[] calls,
// uint256 recentBlock); its own hash is not part of the preimage.
tokens_t parameters(const waypoint::schema::chain_batch_t& batch);
// bytes32[]
tokens_t parameters(const std::vector<waypoint::schema::hash32_t>& hashes);
tokens_t parameters(const waypoint::schema::calls_t& calls);
tokens_t parameters(const waypoint::schema::intent_authorization_t& intent);

/// Calldata of `execute(IntentAuthorization)` on the user's delegate.
waypoint::schema::bytes_t encode_execute(
    const waypoint::schema::intent_authorization_t& intent);

/// Calldata of `selfExecute(Call[])` on the solver's delegate.
waypoint::schema::bytes_t encode_self_execute(
    const waypoint::schema::calls_t& calls);

}  // namespace abi

struct abi_encoder_tag {};

template <>
struct encoder<abi_encoder_tag> final {
  template <typename T>
  waypoint::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, waypoint::schema::bytes_t& out);
};

template <typename T>
waypoint::schema::bytes_t encoder<abi_encoder_tag>::encode(const T& obj) {
  return abi::encode_parameters(abi::parameters(obj));
}

template <typename T>
void encoder<abi_encoder_tag>::encode(const T& obj,
                                      waypoint::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

}  // namespace waypoint::encoding
