#include <waypoint/encoding/rlp/encoder.hpp>

#include <iterator>

namespace waypoint::encoding::rlp {

namespace {

void append(const waypoint::schema::bytes_t& item,
            waypoint::schema::bytes_t& out) {
  out.insert(std::end(out), std::begin(item), std::end(item));
}

// Short form below 56 bytes, otherwise `base + 55 + len(len)` followed by
// the big-endian length.
waypoint::schema::bytes_t encode_header(const uint8_t base,
                                        const std::size_t length) {
  if (length <= 55) {
    return {static_cast<uint8_t>(base + length)};
  }
  auto length_bytes =
      waypoint::schema::to_minimal_bytes(waypoint::schema::uint256_t{length});
  auto header = waypoint::schema::bytes_t{
      static_cast<uint8_t>(base + 55 + length_bytes.size())};
  append(length_bytes, header);
  return header;
}

waypoint::schema::bytes_t authorization_fields(
    const waypoint::schema::authorization_t& authorization) {
  auto fields = waypoint::schema::bytes_t{};
  append(encode_unsigned(authorization.chain_id), fields);
  append(encode(authorization.address), fields);
  append(encode_unsigned(authorization.nonce), fields);
  append(encode_unsigned(authorization.y_parity), fields);
  append(encode_unsigned(authorization.r), fields);
  append(encode_unsigned(authorization.s), fields);
  return fields;
}

waypoint::schema::bytes_t unsigned_transaction_fields(
    const waypoint::schema::set_code_transaction_t& transaction) {
  auto fields = waypoint::schema::bytes_t{};
  append(encode_unsigned(transaction.chain_id), fields);
  append(encode_unsigned(transaction.nonce), fields);
  append(encode_unsigned(transaction.max_priority_fee_per_gas), fields);
  append(encode_unsigned(transaction.max_fee_per_gas), fields);
  append(encode_unsigned(transaction.gas_limit), fields);
  append(encode(transaction.to), fields);
  append(encode_unsigned(transaction.value), fields);
  append(encode_string(waypoint::schema::make_bytes_view(transaction.data)),
         fields);
  // Access lists are not used.
  append(encode_list({}), fields);
  append(encode(transaction.authorization_list), fields);
  return fields;
}

waypoint::schema::bytes_t typed(const uint8_t type,
                                const waypoint::schema::bytes_t& payload) {
  auto out = waypoint::schema::bytes_t{type};
  append(payload, out);
  return out;
}

}  // namespace

waypoint::schema::bytes_t encode_string(
    const waypoint::schema::bytes_view_t& str) {
  if (str.size() == 1 && str[0] <= 0x7F) {
    return {str[0]};
  }
  auto out = encode_header(0x80, str.size());
  out.insert(std::end(out), std::begin(str), std::end(str));
  return out;
}

waypoint::schema::bytes_t encode_unsigned(
    const waypoint::schema::uint256_t& value) {
  auto minimal = waypoint::schema::to_minimal_bytes(value);
  return encode_string(waypoint::schema::make_bytes_view(minimal));
}

waypoint::schema::bytes_t encode_list(
    const waypoint::schema::bytes_view_t& payload) {
  auto out = encode_header(0xC0, payload.size());
  out.insert(std::end(out), std::begin(payload), std::end(payload));
  return out;
}

waypoint::schema::bytes_t encode(const waypoint::schema::address_t& address) {
  return encode_string(address);
}

waypoint::schema::bytes_t encode(
    const waypoint::schema::authorization_request_t& request) {
  auto fields = waypoint::schema::bytes_t{};
  append(encode_unsigned(request.chain_id), fields);
  append(encode(request.address), fields);
  append(encode_unsigned(request.nonce), fields);
  return encode_list(fields);
}

waypoint::schema::bytes_t encode(
    const waypoint::schema::authorization_t& authorization) {
  return encode_list(authorization_fields(authorization));
}

waypoint::schema::bytes_t encode(
    const waypoint::schema::authorizations_t& authorizations) {
  auto items = waypoint::schema::bytes_t{};
  for (const auto& authorization : authorizations) {
    append(encode(authorization), items);
  }
  return encode_list(items);
}

waypoint::schema::bytes_t encode(
    const waypoint::schema::set_code_transaction_t& transaction) {
  auto fields = unsigned_transaction_fields(transaction);
  append(encode_unsigned(transaction.y_parity), fields);
  append(encode_unsigned(transaction.r), fields);
  append(encode_unsigned(transaction.s), fields);
  return typed(waypoint::schema::set_code_transaction_t::type,
               encode_list(fields));
}

waypoint::schema::bytes_t encode_for_signing(
    const waypoint::schema::authorization_request_t& request) {
  return typed(kAuthorizationMagic, encode(request));
}

waypoint::schema::bytes_t encode_for_signing(
    const waypoint::schema::set_code_transaction_t& transaction) {
  return typed(waypoint::schema::set_code_transaction_t::type,
               encode_list(unsigned_transaction_fields(transaction)));
}

}  // namespace waypoint::encoding::rlp
