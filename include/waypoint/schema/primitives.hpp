#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace waypoint::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using uint256_t = boost::multiprecision::uint256_t;
using chain_id_t = uint256_t;
using block_number_t = uint256_t;

// [r || s || v], v in {27, 28}.
using signature_t = std::array<uint8_t, 65>;
using private_key_t = std::array<uint8_t, 32>;
// Uncompressed secp256k1 point without the 0x04 prefix: [x || y].
using public_key_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_address(const std::string_view& hex);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex_prefixed(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Parse a non-negative integer from decimal or 0x-prefixed hex text.
///
/// Rejects signs, whitespace, empty input and values that do not fit in
/// 256 bits.
std::optional<uint256_t> try_parse_uint256(const std::string_view text);

/// Big-endian, left-padded 32-byte word.
hash32_t to_word(const uint256_t& value);
/// Big-endian with leading zero bytes stripped (zero encodes as empty).
bytes_t to_minimal_bytes(const uint256_t& value);
uint256_t from_big_endian(const bytes_view_t& bytes);

std::string to_decimal(const uint256_t& value);
std::string to_quantity(const uint256_t& value);

}  // namespace waypoint::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
