#include <waypoint/schema/json.hpp>

#include <limits>
#include <variant>

namespace waypoint::schema {

namespace {

std::string hex_field(const bytes_view_t& bytes) {
  return to_hex_prefixed(bytes);
}

bytes_t bytes_field(const nlohmann::json& j, const char* key) {
  auto decoded = try_from_hex(j.at(key).get<std::string>());
  if (!decoded) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            std::string{key} + " is not valid hex");
  }
  return *decoded;
}

address_t address_field(const nlohmann::json& j, const char* key) {
  return make_address(j.at(key).get<std::string>());
}

hash32_t hash_field(const nlohmann::json& j, const char* key) {
  return make_hash32(j.at(key).get<std::string>());
}

quantity_t raw_quantity(const nlohmann::json& j) {
  if (j.is_number_unsigned()) {
    return quantity_t{std::in_place_type<uint64_t>, j.get<uint64_t>()};
  }
  if (j.is_number_integer()) {
    return quantity_t{std::in_place_type<int64_t>, j.get<int64_t>()};
  }
  if (j.is_string()) {
    return quantity_t{std::in_place_type<std::string>,
                      j.get<std::string>()};
  }
  waypoint::common::raise(waypoint::common::error_code::validation,
                          "expected an integer or a numeric string, got " +
                              j.dump());
}

uint64_t uint64_field(const nlohmann::json& j, const char* key) {
  auto value = quantity_from_json(j.at(key));
  if (value > std::numeric_limits<uint64_t>::max()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            std::string{key} + " does not fit in 64 bits");
  }
  return static_cast<uint64_t>(value);
}

}  // namespace

nlohmann::json to_json_quantity(const uint256_t& value) {
  return to_decimal(value);
}

uint256_t quantity_from_json(const nlohmann::json& j) {
  return std::visit(
      overloaded{[](const int64_t value) -> uint256_t {
                   if (value < 0) {
                     waypoint::common::raise(
                         waypoint::common::error_code::validation,
                         "quantity must be non-negative");
                   }
                   return uint256_t{value};
                 },
                 [](const uint64_t value) -> uint256_t {
                   return uint256_t{value};
                 },
                 [](const uint256_t& value) -> uint256_t { return value; },
                 [](const std::string& value) -> uint256_t {
                   auto parsed = try_parse_uint256(value);
                   if (!parsed) {
                     waypoint::common::raise(
                         waypoint::common::error_code::validation,
                         "not a uint256: '" + value + "'");
                   }
                   return *parsed;
                 }},
      raw_quantity(j));
}

void to_json(nlohmann::json& j, const call_t& value) {
  j = nlohmann::json{{"to", hex_field(value.to)},
                     {"value", to_json_quantity(value.value)},
                     {"data", hex_field(value.data)}};
}

void from_json(const nlohmann::json& j, call_t& value) {
  value.to = address_field(j, "to");
  value.value = j.contains("value") ? quantity_from_json(j.at("value"))
                                    : uint256_t{0};
  value.data = j.contains("data") ? bytes_field(j, "data") : bytes_t{};
}

void from_json(const nlohmann::json& j, chain_batch_input_t& value) {
  value.chain_id = raw_quantity(j.at("chainId"));
  value.calls = j.at("calls").get<calls_t>();
  value.recent_block = raw_quantity(j.at("recentBlock"));
}

void to_json(nlohmann::json& j, const chain_batch_t& value) {
  j = nlohmann::json{{"hash", hex_field(value.hash)},
                     {"chainId", to_json_quantity(value.chain_id)},
                     {"calls", value.calls},
                     {"recentBlock", to_json_quantity(value.recent_block)}};
}

void from_json(const nlohmann::json& j, chain_batch_t& value) {
  value.hash = hash_field(j, "hash");
  value.chain_id = quantity_from_json(j.at("chainId"));
  value.calls = j.at("calls").get<calls_t>();
  value.recent_block = quantity_from_json(j.at("recentBlock"));
}

void to_json(nlohmann::json& j, const authorization_t& value) {
  j = nlohmann::json{{"address", hex_field(value.address)},
                     {"chainId", to_json_quantity(value.chain_id)},
                     {"nonce", to_json_quantity(value.nonce)},
                     {"yParity", static_cast<int>(value.y_parity)},
                     {"r", to_json_quantity(value.r)},
                     {"s", to_json_quantity(value.s)}};
}

void from_json(const nlohmann::json& j, authorization_t& value) {
  value.address = address_field(j, "address");
  value.chain_id = quantity_from_json(j.at("chainId"));
  value.nonce = uint64_field(j, "nonce");
  auto parity = quantity_from_json(j.at("yParity"));
  if (parity > 1) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            "yParity must be 0 or 1");
  }
  value.y_parity = static_cast<uint8_t>(parity);
  value.r = quantity_from_json(j.at("r"));
  value.s = quantity_from_json(j.at("s"));
}

void to_json(nlohmann::json& j, const intent_authorization_t& value) {
  j = nlohmann::json{{"signature", hex_field(value.signature)},
                     {"chainBatches", value.chain_batches}};
}

void from_json(const nlohmann::json& j, intent_authorization_t& value) {
  value.signature = bytes_field(j, "signature");
  value.chain_batches = j.at("chainBatches").get<chain_batches_t>();
}

void to_json(nlohmann::json& j, const submit_request_t& value) {
  j = nlohmann::json{{"authorization", value.authorization},
                     {"intentAuthorization", value.intent_authorization}};
}

void from_json(const nlohmann::json& j, submit_request_t& value) {
  value.authorization = j.at("authorization").get<authorizations_t>();
  value.intent_authorization =
      j.at("intentAuthorization").get<intent_authorization_t>();
}

void to_json(nlohmann::json& j, const submit_response_t& value) {
  j = nlohmann::json{{"hash", hex_field(value.hash)},
                     {"intentId", value.intent_id}};
}

void from_json(const nlohmann::json& j, submit_response_t& value) {
  value.hash = hash_field(j, "hash");
  value.intent_id = j.at("intentId").get<std::string>();
}

}  // namespace waypoint::schema
