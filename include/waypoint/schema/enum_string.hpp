#pragma once

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

namespace waypoint::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Specialize with a `kMappings` table (wire name, value) to give an enum
/// names.
template <typename Enum>
struct enum_names;

template <typename Enum>
concept named_enum = requires { enum_names<Enum>::kMappings; };

template <named_enum Enum>
constexpr std::optional<std::string_view> try_to_string(const Enum value) {
  const auto& mappings = enum_names<Enum>::kMappings;
  auto it = std::find_if(std::begin(mappings), std::end(mappings),
                         [&](const auto& entry) { return entry.second == value; });
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->first;
}

template <named_enum Enum>
constexpr std::optional<Enum> try_from_string(const std::string_view name) {
  const auto& mappings = enum_names<Enum>::kMappings;
  auto it = std::find_if(std::begin(mappings), std::end(mappings),
                         [&](const auto& entry) { return entry.first == name; });
  if (it == std::end(mappings)) {
    return std::nullopt;
  }
  return it->second;
}

template <named_enum Enum>
constexpr std::string_view to_string(const Enum value) {
  return try_to_string(value).value_or("unknown");
}

}  // namespace waypoint::schema
