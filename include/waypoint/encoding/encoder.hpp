#pragma once
#include <waypoint/schema/primitives.hpp>

namespace waypoint::encoding {

// Wire codecs are chosen at build time by tag:
//   auto enc = encoder<abi_encoder_tag>{};
//   auto preimage = enc.encode(batch);
// Each specialization maps schema types onto its own encoding.
template <typename Library>
struct encoder {
  template <typename T>
  waypoint::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, waypoint::schema::bytes_t& out);
};

}  // namespace waypoint::encoding
