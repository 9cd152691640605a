#include <waypoint/common/error.hpp>
#include <waypoint/crypto/secp256k1.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <algorithm>
#include <array>
#include <memory>

namespace waypoint::crypto {

namespace {

using context_ptr =
    std::unique_ptr<secp256k1_context, decltype(&secp256k1_context_destroy)>;

constexpr auto kUncompressedSize = std::size_t{65};

[[noreturn]] void fail(const std::string& message) {
  waypoint::common::raise(waypoint::common::error_code::signature, message);
}

// Shared read-only context; libsecp256k1 contexts are thread-safe for every
// call that does not mutate them.
const secp256k1_context* context() {
  static const auto instance = context_ptr{
      secp256k1_context_create(SECP256K1_CONTEXT_SIGN |
                               SECP256K1_CONTEXT_VERIFY),
      secp256k1_context_destroy};
  if (!instance) {
    fail("secp256k1_context_create failed");
  }
  return instance.get();
}

waypoint::schema::public_key_t serialize(const secp256k1_pubkey& point) {
  auto encoded = std::array<uint8_t, kUncompressedSize>{};
  auto size = encoded.size();
  if (secp256k1_ec_pubkey_serialize(context(), encoded.data(), &size, &point,
                                    SECP256K1_EC_UNCOMPRESSED) != 1 ||
      size != encoded.size()) {
    fail("secp256k1_ec_pubkey_serialize failed");
  }
  auto key = waypoint::schema::public_key_t{};
  std::copy(std::begin(encoded) + 1, std::end(encoded), std::begin(key));
  return key;
}

}  // namespace

waypoint::schema::public_key_t derive_public_key(
    const waypoint::schema::private_key_t& private_key) {
  if (secp256k1_ec_seckey_verify(context(), private_key.data()) != 1) {
    fail("private key is outside the secp256k1 scalar range");
  }
  auto point = secp256k1_pubkey{};
  if (secp256k1_ec_pubkey_create(context(), &point, private_key.data()) != 1) {
    fail("secp256k1_ec_pubkey_create failed");
  }
  return serialize(point);
}

recoverable_signature_t sign_digest(
    const waypoint::schema::private_key_t& private_key,
    const waypoint::schema::hash32_t& digest) {
  auto signature = secp256k1_ecdsa_recoverable_signature{};
  // RFC 6979 nonces; the library only produces lower-half s values.
  if (secp256k1_ecdsa_sign_recoverable(context(), &signature, digest.data(),
                                       private_key.data(),
                                       secp256k1_nonce_function_rfc6979,
                                       nullptr) != 1) {
    fail("secp256k1_ecdsa_sign_recoverable rejected the private key");
  }

  auto compact = std::array<uint8_t, 64>{};
  auto recovery_id = 0;
  if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
          context(), compact.data(), &recovery_id, &signature) != 1) {
    fail("secp256k1_ecdsa_recoverable_signature_serialize_compact failed");
  }
  return recoverable_signature_t{
      .r = waypoint::schema::from_big_endian(
          waypoint::schema::bytes_view_t{compact.data(), 32}),
      .s = waypoint::schema::from_big_endian(
          waypoint::schema::bytes_view_t{compact.data() + 32, 32}),
      .y_parity = static_cast<uint8_t>(recovery_id)};
}

std::optional<waypoint::schema::public_key_t> recover_public_key(
    const waypoint::schema::hash32_t& digest,
    const recoverable_signature_t& signature) {
  if (signature.y_parity > 1) {
    return std::nullopt;
  }

  auto compact = std::array<uint8_t, 64>{};
  auto r = waypoint::schema::to_word(signature.r);
  auto s = waypoint::schema::to_word(signature.s);
  std::copy(std::begin(r), std::end(r), std::begin(compact));
  std::copy(std::begin(s), std::end(s), std::begin(compact) + 32);

  auto parsed = secp256k1_ecdsa_recoverable_signature{};
  if (secp256k1_ecdsa_recoverable_signature_parse_compact(
          context(), &parsed, compact.data(), signature.y_parity) != 1) {
    return std::nullopt;
  }
  auto point = secp256k1_pubkey{};
  if (secp256k1_ecdsa_recover(context(), &point, &parsed, digest.data()) != 1) {
    return std::nullopt;
  }
  return serialize(point);
}

}  // namespace waypoint::crypto
