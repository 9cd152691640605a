#pragma once
#include <waypoint/schema/primitives.hpp>
#include <vector>

namespace waypoint::schema {

template <uint16_t Version>
struct authorization_request;

// Unsigned EIP-7702 tuple: delegate `address` on `chain_id` at `nonce`.
template <>
struct authorization_request<1> final {
  constexpr static auto version = uint16_t{1};
  address_t address;
  chain_id_t chain_id;
  uint64_t nonce{};

  bool operator==(const authorization_request<1>&) const = default;
};

using authorization_request_t = authorization_request<1>;

template <uint16_t Version>
struct authorization;

template <>
struct authorization<1> final {
  constexpr static auto version = uint16_t{1};
  address_t address;
  chain_id_t chain_id;
  uint64_t nonce{};
  uint8_t y_parity{};
  uint256_t r;
  uint256_t s;

  bool operator==(const authorization<1>&) const = default;
};

using authorization_t = authorization<1>;
using authorizations_t = std::vector<authorization_t>;

inline authorization_request_t make_authorization_request(
    const authorization_t& authorization) {
  return authorization_request_t{.address = authorization.address,
                                 .chain_id = authorization.chain_id,
                                 .nonce = authorization.nonce};
}

}  // namespace waypoint::schema
