#pragma once

#include <waypoint/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace waypoint::schema {

// Per-chain execution state of the solver.
enum class leg_status_t : uint8_t {
  wait_for_watermark = 0,
  submit = 1,
  confirmed = 2,
  failed = 3
};

inline constexpr auto kLegStatusMappings =
    std::array{std::pair<std::string_view, leg_status_t>{
                   "wait_for_watermark", leg_status_t::wait_for_watermark},
               std::pair<std::string_view, leg_status_t>{
                   "submit", leg_status_t::submit},
               std::pair<std::string_view, leg_status_t>{
                   "confirmed", leg_status_t::confirmed},
               std::pair<std::string_view, leg_status_t>{
                   "failed", leg_status_t::failed}};

template <>
struct enum_names<leg_status_t> {
  static constexpr auto kMappings = kLegStatusMappings;
};

}  // namespace waypoint::schema
