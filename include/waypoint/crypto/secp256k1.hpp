#pragma once

#include <waypoint/schema/primitives.hpp>

#include <optional>

namespace waypoint::crypto {

// ECDSA signature with the parity of R's y coordinate.
struct recoverable_signature_t final {
  waypoint::schema::uint256_t r;
  waypoint::schema::uint256_t s;
  uint8_t y_parity{};
};

waypoint::schema::public_key_t derive_public_key(
    const waypoint::schema::private_key_t& private_key);

/// Sign a 32-byte digest with an RFC 6979 nonce. `s` is in the lower half of
/// the curve order and `y_parity` is the matching recovery id.
recoverable_signature_t sign_digest(
    const waypoint::schema::private_key_t& private_key,
    const waypoint::schema::hash32_t& digest);

std::optional<waypoint::schema::public_key_t> recover_public_key(
    const waypoint::schema::hash32_t& digest,
    const recoverable_signature_t& signature);

}  // namespace waypoint::crypto
