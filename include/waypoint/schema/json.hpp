#pragma once

#include <waypoint/common/error.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/call.hpp>
#include <waypoint/schema/chain_batch.hpp>
#include <waypoint/schema/intent_authorization.hpp>
#include <waypoint/schema/relay.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

// JSON wire mapping. Integers (chain ids, values, nonces, block numbers,
// r and s) are written as decimal strings; byte strings as 0x-hex.
namespace waypoint::schema {

nlohmann::json to_json_quantity(const uint256_t& value);
uint256_t quantity_from_json(const nlohmann::json& j);

void to_json(nlohmann::json& j, const call_t& value);
void from_json(const nlohmann::json& j, call_t& value);

void from_json(const nlohmann::json& j, chain_batch_input_t& value);

void to_json(nlohmann::json& j, const chain_batch_t& value);
void from_json(const nlohmann::json& j, chain_batch_t& value);

void to_json(nlohmann::json& j, const authorization_t& value);
void from_json(const nlohmann::json& j, authorization_t& value);

void to_json(nlohmann::json& j, const intent_authorization_t& value);
void from_json(const nlohmann::json& j, intent_authorization_t& value);

void to_json(nlohmann::json& j, const submit_request_t& value);
void from_json(const nlohmann::json& j, submit_request_t& value);

void to_json(nlohmann::json& j, const submit_response_t& value);
void from_json(const nlohmann::json& j, submit_response_t& value);

/// Convert a parsed document to T; schema mismatches raise
/// error_code::validation.
template <typename T>
T convert_json(const nlohmann::json& j) {
  try {
    return j.get<T>();
  } catch (const nlohmann::json::exception& e) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            std::string{"malformed JSON document: "} + e.what());
  }
}

template <typename T>
T decode_json(const std::string_view& text) {
  auto document = nlohmann::json::parse(text, nullptr, false);
  if (document.is_discarded()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "document is not valid JSON");
  }
  return convert_json<T>(document);
}

template <typename T>
std::string encode_json(const T& value, const int indent = -1) {
  return nlohmann::json(value).dump(indent);
}

}  // namespace waypoint::schema
