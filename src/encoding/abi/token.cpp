#include <waypoint/crypto/keccak.hpp>
#include <waypoint/encoding/abi/token.hpp>

#include <algorithm>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace waypoint::encoding::abi {

namespace {

constexpr auto kWordSize = std::size_t{32};

void append_word(const waypoint::schema::hash32_t& word,
                 waypoint::schema::bytes_t& out) {
  out.insert(std::end(out), std::begin(word), std::end(word));
}

void append_length(const std::size_t length, waypoint::schema::bytes_t& out) {
  append_word(waypoint::schema::to_word(waypoint::schema::uint256_t{length}),
              out);
}

std::size_t head_size(const token& value) {
  if (value.dynamic()) {
    return kWordSize;
  }
  if (value.kind == token_kind::tuple) {
    return std::accumulate(
        std::begin(value.children), std::end(value.children), std::size_t{0},
        [](auto total, const auto& child) { return total + head_size(child); });
  }
  return kWordSize;
}

void encode_sequence(const tokens_t& items, waypoint::schema::bytes_t& out);

void encode_body(const token& value, waypoint::schema::bytes_t& out) {
  switch (value.kind) {
    case token_kind::word:
      append_word(value.word, out);
      break;
    case token_kind::bytes: {
      append_length(value.bytes.size(), out);
      out.insert(std::end(out), std::begin(value.bytes),
                 std::end(value.bytes));
      auto padding = (kWordSize - (value.bytes.size() % kWordSize)) % kWordSize;
      out.insert(std::end(out), padding, uint8_t{0});
      break;
    }
    case token_kind::tuple:
      encode_sequence(value.children, out);
      break;
    case token_kind::array:
      append_length(value.children.size(), out);
      encode_sequence(value.children, out);
      break;
  }
}

void encode_sequence(const tokens_t& items, waypoint::schema::bytes_t& out) {
  auto heads_length = std::accumulate(
      std::begin(items), std::end(items), std::size_t{0},
      [](auto total, const auto& item) { return total + head_size(item); });

  auto head = waypoint::schema::bytes_t{};
  auto tail = waypoint::schema::bytes_t{};
  head.reserve(heads_length);
  for (const auto& item : items) {
    if (item.dynamic()) {
      append_length(heads_length + tail.size(), head);
      encode_body(item, tail);
    } else {
      encode_body(item, head);
    }
  }
  if (head.size() != heads_length) {
    throw std::logic_error{"abi head size does not match its layout"};
  }
  out.insert(std::end(out), std::begin(head), std::end(head));
  out.insert(std::end(out), std::begin(tail), std::end(tail));
}

}  // namespace

bool token::dynamic() const {
  switch (kind) {
    case token_kind::word:
      return false;
    case token_kind::bytes:
    case token_kind::array:
      return true;
    case token_kind::tuple:
      return std::any_of(std::begin(children), std::end(children),
                         [](const auto& child) { return child.dynamic(); });
  }
  return false;
}

token make_uint(const waypoint::schema::uint256_t& value) {
  return token{.kind = token_kind::word,
               .word = waypoint::schema::to_word(value)};
}

token make_address(const waypoint::schema::address_t& value) {
  auto word = waypoint::schema::hash32_t{};
  std::copy(std::begin(value), std::end(value),
            std::begin(word) + (word.size() - value.size()));
  return token{.kind = token_kind::word, .word = word};
}

token make_bytes32(const waypoint::schema::hash32_t& value) {
  return token{.kind = token_kind::word, .word = value};
}

token make_bytes(const waypoint::schema::bytes_view_t& value) {
  return token{.kind = token_kind::bytes,
               .bytes = waypoint::schema::make_bytes(value)};
}

token make_tuple(tokens_t children) {
  return token{.kind = token_kind::tuple, .children = std::move(children)};
}

token make_array(tokens_t children) {
  return token{.kind = token_kind::array, .children = std::move(children)};
}

waypoint::schema::bytes_t encode_parameters(const tokens_t& params) {
  auto out = waypoint::schema::bytes_t{};
  encode_sequence(params, out);
  return out;
}

waypoint::schema::bytes_t encode_function_call(
    const std::string_view& signature,
    const tokens_t& params) {
  auto selector = waypoint::crypto::function_selector(signature);
  auto out = waypoint::schema::bytes_t{std::begin(selector), std::end(selector)};
  encode_sequence(params, out);
  return out;
}

}  // namespace waypoint::encoding::abi
