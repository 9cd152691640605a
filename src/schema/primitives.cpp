#include <waypoint/common/error.hpp>
#include <waypoint/schema/primitives.hpp>

#include <boost/algorithm/hex.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>

namespace waypoint::schema {

namespace {

std::string_view strip_0x(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<bytes_t> decode_hex(const std::string_view text) {
  auto digits = strip_0x(text);
  auto decoded = bytes_t{};
  decoded.reserve(digits.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(digits), std::end(digits),
                            std::back_inserter(decoded));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = decode_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(out));
  return out;
}

const boost::multiprecision::cpp_int& max_uint256() {
  static const auto max =
      (boost::multiprecision::cpp_int{1} << 256) - 1;
  return max;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  if (bytes.size() != 32) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "invalid bytes32 hex: " + std::string{hex});
  }
  return *hash;
}

hash32_t make_zero_hash() {
  return {};
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "invalid address hex: " + std::string{hex});
  }
  return *address;
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::string to_hex_prefixed(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return decode_hex(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = decode_hex(hex);
  if (!decoded.has_value()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "invalid hex input");
  }
  return *decoded;
}

std::optional<uint256_t> try_parse_uint256(const std::string_view text) {
  auto digits = strip_0x(text);
  if (digits.empty()) {
    return std::nullopt;
  }
  auto hex = digits.size() != text.size();
  auto valid = std::all_of(std::begin(digits), std::end(digits), [&](char c) {
    auto u = static_cast<unsigned char>(c);
    return hex ? std::isxdigit(u) != 0 : std::isdigit(u) != 0;
  });
  if (!valid) {
    return std::nullopt;
  }

  // cpp_int reads a bare leading zero as octal.
  if (!hex) {
    digits.remove_prefix(
        std::min(digits.find_first_not_of('0'), digits.size() - 1));
  }
  auto value = boost::multiprecision::cpp_int{
      hex ? "0x" + std::string{digits} : std::string{digits}};
  if (value > max_uint256()) {
    return std::nullopt;
  }
  return static_cast<uint256_t>(value);
}

hash32_t to_word(const uint256_t& value) {
  auto minimal = to_minimal_bytes(value);
  auto word = hash32_t{};
  std::copy(std::begin(minimal), std::end(minimal),
            std::begin(word) + (word.size() - minimal.size()));
  return word;
}

bytes_t to_minimal_bytes(const uint256_t& value) {
  auto out = bytes_t{};
  if (value == 0) {
    return out;
  }
  boost::multiprecision::export_bits(value, std::back_inserter(out), 8);
  return out;
}

uint256_t from_big_endian(const bytes_view_t& bytes) {
  auto value = uint256_t{};
  if (bytes.empty()) {
    return value;
  }
  if (bytes.size() > 32) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "integer wider than 256 bits");
  }
  boost::multiprecision::import_bits(value, std::begin(bytes),
                                     std::end(bytes), 8);
  return value;
}

std::string to_decimal(const uint256_t& value) {
  return value.str();
}

std::string to_quantity(const uint256_t& value) {
  if (value == 0) {
    return "0x0";
  }
  auto minimal = to_minimal_bytes(value);
  auto hex = to_hex(minimal);
  auto first = hex.find_first_not_of('0');
  return "0x" + hex.substr(first);
}

}  // namespace waypoint::schema
