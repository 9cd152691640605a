#pragma once
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/primitives.hpp>

namespace waypoint::schema {

template <uint16_t Version>
struct intent_authorization;

// Argument of the delegate's `execute`: the user's signature over the intent
// digest together with the (possibly disclosed) batch set.
template <>
struct intent_authorization<1> final {
  constexpr static auto version = uint16_t{1};
  bytes_t signature;
  chain_batches_t chain_batches;

  bool operator==(const intent_authorization<1>&) const = default;
};

using intent_authorization_t = intent_authorization<1>;

}  // namespace waypoint::schema
