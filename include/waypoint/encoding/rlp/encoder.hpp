#pragma once
#include <waypoint/encoding/encoder.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/primitives.hpp>
#include <waypoint/schema/transaction.hpp>
#include <iterator>

namespace waypoint::encoding {

namespace rlp {

inline constexpr auto kAuthorizationMagic = uint8_t{0x05};

waypoint::schema::bytes_t encode_string(
    const waypoint::schema::bytes_view_t& str);
waypoint::schema::bytes_t encode_unsigned(
    const waypoint::schema::uint256_t& value);
/// Wraps already-encoded items.
waypoint::schema::bytes_t encode_list(
    const waypoint::schema::bytes_view_t& payload);

waypoint::schema::bytes_t encode(const waypoint::schema::address_t& address);
// [chain_id, address, nonce]
waypoint::schema::bytes_t encode(
    const waypoint::schema::authorization_request_t& request);
// [chain_id, address, nonce, y_parity, r, s]
waypoint::schema::bytes_t encode(
    const waypoint::schema::authorization_t& authorization);
waypoint::schema::bytes_t encode(
    const waypoint::schema::authorizations_t& authorizations);
/// 0x04 || rlp([chain_id, nonce, max_priority_fee_per_gas, max_fee_per_gas,
/// gas_limit, to, value, data, access_list, authorization_list, y_parity, r,
/// s])
waypoint::schema::bytes_t encode(
    const waypoint::schema::set_code_transaction_t& transaction);

/// 0x05 || rlp([chain_id, address, nonce]), the EIP-7702 signing preimage.
waypoint::schema::bytes_t encode_for_signing(
    const waypoint::schema::authorization_request_t& request);
/// The type-4 envelope without y_parity, r and s.
waypoint::schema::bytes_t encode_for_signing(
    const waypoint::schema::set_code_transaction_t& transaction);

}  // namespace rlp

struct rlp_encoder_tag {};

template <>
struct encoder<rlp_encoder_tag> final {
  template <typename T>
  waypoint::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, waypoint::schema::bytes_t& out);
};

template <typename T>
waypoint::schema::bytes_t encoder<rlp_encoder_tag>::encode(const T& obj) {
  return rlp::encode(obj);
}

template <typename T>
void encoder<rlp_encoder_tag>::encode(const T& obj,
                                      waypoint::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

}  // namespace waypoint::encoding
