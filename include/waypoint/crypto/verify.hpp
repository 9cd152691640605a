#pragma once

#include <waypoint/crypto/secp256k1.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/primitives.hpp>

#include <optional>

namespace waypoint::crypto {

/// Parses a 65-byte [r || s || v] signature. v may be a raw recovery id
/// (0, 1) or the legacy 27/28 form.
std::optional<recoverable_signature_t> parse_signature(
    const waypoint::schema::bytes_view_t& signature);

std::optional<waypoint::schema::address_t> recover_address(
    const waypoint::schema::hash32_t& digest,
    const recoverable_signature_t& signature);

/// Signer of an EIP-191 personal-message signature over `message`.
std::optional<waypoint::schema::address_t> recover_message_signer(
    const waypoint::schema::bytes_view_t& message,
    const waypoint::schema::bytes_view_t& signature);

bool verify_intent_signature(const waypoint::schema::hash32_t& digest,
                             const waypoint::schema::bytes_view_t& signature,
                             const waypoint::schema::address_t& expected);

/// Account that signed an EIP-7702 authorization. Raises
/// error_code::signature when the tuple does not recover.
waypoint::schema::address_t recover_authority(
    const waypoint::schema::authorization_t& authorization);

}  // namespace waypoint::crypto
