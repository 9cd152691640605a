#pragma once
#include <waypoint/schema/primitives.hpp>
#include <vector>

namespace waypoint::schema {

template <uint16_t Version>
struct call;

template <>
struct call<1> final {
  constexpr static auto version = uint16_t{1};
  address_t to;
  uint256_t value;
  bytes_t data;

  bool operator==(const call<1>&) const = default;
};

using call_t = call<1>;
using calls_t = std::vector<call_t>;

}  // namespace waypoint::schema
