#pragma once
#include <waypoint/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace waypoint::crypto {

waypoint::schema::hash32_t keccak256(const std::string_view& str);
waypoint::schema::hash32_t keccak256(
    const waypoint::schema::bytes_view_t& bytes);

/// First four bytes of keccak256 over a canonical function signature.
std::array<uint8_t, 4> function_selector(const std::string_view& signature);

/// keccak256("\x19Ethereum Signed Message:\n" || len || message).
waypoint::schema::hash32_t hash_personal_message(
    const waypoint::schema::bytes_view_t& message);

/// Address of the uncompressed 64-byte public key (x || y).
waypoint::schema::address_t address_from_public_key(
    const waypoint::schema::bytes_view_t& public_key);

/// EIP-55 mixed-case rendering.
std::string to_checksum_address(const waypoint::schema::address_t& address);

}  // namespace waypoint::crypto
