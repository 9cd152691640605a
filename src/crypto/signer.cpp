#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/signer.hpp>
#include <waypoint/encoding/rlp/encoder.hpp>

#include <algorithm>
#include <iterator>

namespace waypoint::crypto {

signer::signer(const waypoint::schema::private_key_t& private_key)
    : private_key_{private_key},
      public_key_{derive_public_key(private_key)},
      address_{address_from_public_key(public_key_)} {}

signer signer::from_hex(const std::string_view& hex) {
  auto key = waypoint::schema::try_make_hash32(hex);
  if (!key) {
    waypoint::common::raise(waypoint::common::error_code::signature,
                            "private key must be 32 bytes of hex");
  }
  return signer{*key};
}

recoverable_signature_t signer::sign_hash(
    const waypoint::schema::hash32_t& digest) const {
  return sign_digest(private_key_, digest);
}

waypoint::schema::signature_t signer::sign_message(
    const waypoint::schema::bytes_view_t& message) const {
  return to_signature(sign_hash(hash_personal_message(message)));
}

waypoint::schema::signature_t signer::sign_intent(
    const waypoint::schema::hash32_t& digest) const {
  return sign_message(waypoint::schema::bytes_view_t{digest});
}

waypoint::schema::authorization_t signer::sign_authorization(
    const waypoint::schema::authorization_request_t& request) const {
  auto preimage = waypoint::encoding::rlp::encode_for_signing(request);
  auto signature =
      sign_hash(keccak256(waypoint::schema::make_bytes_view(preimage)));
  return waypoint::schema::authorization_t{.address = request.address,
                                           .chain_id = request.chain_id,
                                           .nonce = request.nonce,
                                           .y_parity = signature.y_parity,
                                           .r = signature.r,
                                           .s = signature.s};
}

waypoint::schema::signature_t to_signature(
    const recoverable_signature_t& signature) {
  auto out = waypoint::schema::signature_t{};
  auto r = waypoint::schema::to_word(signature.r);
  auto s = waypoint::schema::to_word(signature.s);
  std::copy(std::begin(r), std::end(r), std::begin(out));
  std::copy(std::begin(s), std::end(s), std::begin(out) + 32);
  out[64] = static_cast<uint8_t>(27 + signature.y_parity);
  return out;
}

}  // namespace waypoint::crypto
