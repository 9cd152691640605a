#pragma once

#include <waypoint/crypto/secp256k1.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/primitives.hpp>

#include <string_view>

namespace waypoint::crypto {

/// A secp256k1 account key.
///
/// Signers are plain values handed to whatever needs to sign; nothing in the
/// library keeps a process-wide wallet.
class signer final {
 public:
  explicit signer(const waypoint::schema::private_key_t& private_key);

  /// Accepts 0x-prefixed or bare hex.
  static signer from_hex(const std::string_view& hex);

  const waypoint::schema::address_t& address() const { return address_; }
  const waypoint::schema::public_key_t& public_key() const {
    return public_key_;
  }

  recoverable_signature_t sign_hash(
      const waypoint::schema::hash32_t& digest) const;

  /// EIP-191 personal-message signature, [r || s || v] with v in {27, 28}.
  waypoint::schema::signature_t sign_message(
      const waypoint::schema::bytes_view_t& message) const;

  /// Signs the raw 32 bytes of an intent digest as a personal message.
  waypoint::schema::signature_t sign_intent(
      const waypoint::schema::hash32_t& digest) const;

  /// EIP-7702 authorization over keccak256(0x05 || rlp([chain_id, address,
  /// nonce])).
  waypoint::schema::authorization_t sign_authorization(
      const waypoint::schema::authorization_request_t& request) const;

 private:
  waypoint::schema::private_key_t private_key_;
  waypoint::schema::public_key_t public_key_;
  waypoint::schema::address_t address_;
};

waypoint::schema::signature_t to_signature(
    const recoverable_signature_t& signature);

}  // namespace waypoint::crypto
