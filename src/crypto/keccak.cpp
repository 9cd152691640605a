#include <ethash/keccak.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace waypoint::crypto {

namespace {

waypoint::schema::hash32_t to_hash32(const ethash::hash256& digest) {
  auto output = waypoint::schema::hash32_t{};
  std::copy(std::begin(digest.bytes), std::end(digest.bytes),
            std::begin(output));
  return output;
}

}  // namespace

waypoint::schema::hash32_t keccak256(const std::string_view& str) {
  return to_hash32(ethash::keccak256(
      reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

waypoint::schema::hash32_t keccak256(
    const waypoint::schema::bytes_view_t& bytes) {
  return to_hash32(ethash::keccak256(bytes.data(), bytes.size()));
}

std::array<uint8_t, 4> function_selector(const std::string_view& signature) {
  auto digest = keccak256(signature);
  auto selector = std::array<uint8_t, 4>{};
  std::copy_n(std::begin(digest), selector.size(), std::begin(selector));
  return selector;
}

waypoint::schema::hash32_t hash_personal_message(
    const waypoint::schema::bytes_view_t& message) {
  auto prefix = std::string{"\x19"
                            "Ethereum Signed Message:\n"} +
                std::to_string(message.size());
  auto material = waypoint::schema::make_bytes(std::string_view{prefix});
  material.insert(std::end(material), std::begin(message), std::end(message));
  return keccak256(waypoint::schema::make_bytes_view(material));
}

waypoint::schema::address_t address_from_public_key(
    const waypoint::schema::bytes_view_t& public_key) {
  if (public_key.size() != 64) {
    waypoint::common::raise(waypoint::common::error_code::signature,
                            "public key must be 64 bytes (x || y)");
  }
  auto digest = keccak256(public_key);
  auto address = waypoint::schema::address_t{};
  std::copy(std::begin(digest) + 12, std::end(digest), std::begin(address));
  return address;
}

std::string to_checksum_address(const waypoint::schema::address_t& address) {
  auto lower = waypoint::schema::to_hex(address);
  auto digest = keccak256(std::string_view{lower});
  auto out = std::string{"0x"};
  out.reserve(42);
  for (std::size_t i = 0; i < lower.size(); ++i) {
    auto nibble = (i % 2) == 0 ? (digest[i / 2] >> 4u) : (digest[i / 2] & 0x0Fu);
    auto c = lower[i];
    out.push_back(nibble >= 8 ? static_cast<char>(std::toupper(
                                    static_cast<unsigned char>(c)))
                              : c);
  }
  return out;
}

}  // namespace waypoint::crypto
