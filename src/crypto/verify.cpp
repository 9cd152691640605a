#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/verify.hpp>
#include <waypoint/encoding/rlp/encoder.hpp>

namespace waypoint::crypto {

std::optional<recoverable_signature_t> parse_signature(
    const waypoint::schema::bytes_view_t& signature) {
  if (signature.size() != 65) {
    return std::nullopt;
  }
  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  if (v > 1) {
    return std::nullopt;
  }
  return recoverable_signature_t{
      .r = waypoint::schema::from_big_endian(signature.subspan(0, 32)),
      .s = waypoint::schema::from_big_endian(signature.subspan(32, 32)),
      .y_parity = v};
}

std::optional<waypoint::schema::address_t> recover_address(
    const waypoint::schema::hash32_t& digest,
    const recoverable_signature_t& signature) {
  auto public_key = recover_public_key(digest, signature);
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_public_key(waypoint::schema::bytes_view_t{*public_key});
}

std::optional<waypoint::schema::address_t> recover_message_signer(
    const waypoint::schema::bytes_view_t& message,
    const waypoint::schema::bytes_view_t& signature) {
  auto parsed = parse_signature(signature);
  if (!parsed) {
    return std::nullopt;
  }
  return recover_address(hash_personal_message(message), *parsed);
}

bool verify_intent_signature(const waypoint::schema::hash32_t& digest,
                             const waypoint::schema::bytes_view_t& signature,
                             const waypoint::schema::address_t& expected) {
  auto recovered = recover_message_signer(
      waypoint::schema::bytes_view_t{digest}, signature);
  return recovered && *recovered == expected;
}

waypoint::schema::address_t recover_authority(
    const waypoint::schema::authorization_t& authorization) {
  auto preimage = waypoint::encoding::rlp::encode_for_signing(
      waypoint::schema::make_authorization_request(authorization));
  auto digest = keccak256(waypoint::schema::make_bytes_view(preimage));
  auto recovered = recover_address(
      digest, recoverable_signature_t{.r = authorization.r,
                                      .s = authorization.s,
                                      .y_parity = authorization.y_parity});
  if (!recovered) {
    waypoint::common::raise(waypoint::common::error_code::signature,
                            "authorization signature does not recover");
  }
  return *recovered;
}

}  // namespace waypoint::crypto
