#pragma once
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/intent_authorization.hpp>
#include <string>

namespace waypoint::schema {

template <uint16_t Version>
struct submit_request;

template <>
struct submit_request<1> final {
  constexpr static auto version = uint16_t{1};
  authorizations_t authorization;
  intent_authorization_t intent_authorization;
};

using submit_request_t = submit_request<1>;

template <uint16_t Version>
struct submit_response;

template <>
struct submit_response<1> final {
  constexpr static auto version = uint16_t{1};
  hash32_t hash;
  std::string intent_id;
};

using submit_response_t = submit_response<1>;

}  // namespace waypoint::schema
