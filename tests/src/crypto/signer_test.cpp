#include <gtest/gtest.h>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/secp256k1.hpp>
#include <waypoint/crypto/signer.hpp>
#include <waypoint/crypto/verify.hpp>
#include <waypoint/testing/common.hpp>

namespace {

// secp256k1 group order halved.
const auto kHalfOrder = waypoint::schema::uint256_t{
    "0x7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0"};

}  // namespace

TEST(crypto_signer, derives_known_addresses) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  EXPECT_EQ(user.address(),
            waypoint::schema::make_address(waypoint::testing::kUserAddress));

  auto solver = waypoint::crypto::signer::from_hex(
      waypoint::testing::kSolverKey.substr(2));
  EXPECT_EQ(solver.address(),
            waypoint::schema::make_address(waypoint::testing::kSolverAddress));

  auto other = waypoint::crypto::signer::from_hex(
      "4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
  EXPECT_EQ(waypoint::testing::hex(other.address()),
            "2c7536e3605d9c16a7a3d7b1898e529396a65c23");
}

TEST(crypto_signer, rejects_malformed_private_keys) {
  EXPECT_THROW(waypoint::crypto::signer::from_hex("0x1234"),
               waypoint::common::error);
  EXPECT_THROW(waypoint::crypto::signer::from_hex(std::string(64, 'z')),
               waypoint::common::error);
}

TEST(crypto_signer, sign_hash_is_low_s_and_recoverable) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto digest = waypoint::crypto::keccak256(std::string_view{"waypoint"});
  auto signature = user.sign_hash(digest);

  EXPECT_LE(signature.s, kHalfOrder);
  EXPECT_LE(signature.y_parity, 1);
  auto recovered = waypoint::crypto::recover_address(digest, signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, user.address());
}

TEST(crypto_signer, sign_hash_uses_deterministic_nonces) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto digest = waypoint::testing::make_hash(0x01);
  auto signature = user.sign_hash(digest);

  EXPECT_EQ(signature.r,
            waypoint::schema::uint256_t{"0xdeefdf0ded88034d659db088cb6fc7b1a14b3"
                                        "692204665f689a4ef7ad62de3e5"});
  EXPECT_EQ(signature.s,
            waypoint::schema::uint256_t{"0x29c002296c16b76c25f0d6f616b5b001babd6"
                                        "9c4ec6e9fa56f4e2de551608b5b"});
  EXPECT_EQ(signature.y_parity, 0);

  auto again = user.sign_hash(digest);
  EXPECT_EQ(again.r, signature.r);
  EXPECT_EQ(again.s, signature.s);
}

TEST(crypto_signer, rejects_out_of_range_private_keys) {
  EXPECT_THROW(waypoint::crypto::signer::from_hex(std::string(64, '0')),
               waypoint::common::error);
  EXPECT_THROW(
      waypoint::crypto::signer::from_hex(
          "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141"),
      waypoint::common::error);
}

TEST(crypto_signer, message_signatures_recover_to_signer) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto message = waypoint::schema::make_bytes(std::string_view{"hello world"});
  auto signature =
      user.sign_message(waypoint::schema::make_bytes_view(message));

  EXPECT_TRUE(signature[64] == 27 || signature[64] == 28);
  auto recovered = waypoint::crypto::recover_message_signer(
      waypoint::schema::make_bytes_view(message),
      waypoint::schema::bytes_view_t{signature});
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, user.address());
}

TEST(crypto_signer, parse_signature_accepts_both_v_forms) {
  auto signature = waypoint::schema::signature_t{};
  signature[31] = 1;
  signature[63] = 2;

  signature[64] = 28;
  auto legacy = waypoint::crypto::parse_signature(signature);
  ASSERT_TRUE(legacy.has_value());
  EXPECT_EQ(legacy->y_parity, 1);
  EXPECT_EQ(legacy->r, 1);
  EXPECT_EQ(legacy->s, 2);

  signature[64] = 0;
  auto raw = waypoint::crypto::parse_signature(signature);
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw->y_parity, 0);

  signature[64] = 2;
  EXPECT_FALSE(waypoint::crypto::parse_signature(signature).has_value());
  signature[64] = 29;
  EXPECT_FALSE(waypoint::crypto::parse_signature(signature).has_value());

  auto short_signature = waypoint::schema::bytes_t(64, 0x01);
  EXPECT_FALSE(waypoint::crypto::parse_signature(short_signature).has_value());
}

TEST(crypto_signer, intent_signature_verifies_only_for_signer) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto digest = waypoint::schema::make_hash32(std::string_view{
      "0xfe8908e87186efed24dddbdfd361e1042707aaf559d0f100a08b0cc3dd7a1d95"});
  auto signature = user.sign_intent(digest);

  EXPECT_TRUE(waypoint::crypto::verify_intent_signature(
      digest, signature, user.address()));
  EXPECT_FALSE(waypoint::crypto::verify_intent_signature(
      digest, signature,
      waypoint::schema::make_address(waypoint::testing::kSolverAddress)));

  auto other_digest = digest;
  other_digest[0] ^= 0x01;
  EXPECT_FALSE(waypoint::crypto::verify_intent_signature(
      other_digest, signature, user.address()));

  auto truncated = waypoint::schema::bytes_t(std::begin(signature),
                                             std::end(signature) - 1);
  EXPECT_FALSE(waypoint::crypto::verify_intent_signature(digest, truncated,
                                                         user.address()));
}

TEST(crypto_signer, intent_signature_is_personal_sign_over_raw_digest) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto digest = waypoint::testing::make_hash(0x10);
  auto signature = user.sign_intent(digest);
  auto parsed = waypoint::crypto::parse_signature(signature);
  ASSERT_TRUE(parsed.has_value());

  auto recovered = waypoint::crypto::recover_address(
      waypoint::crypto::hash_personal_message(digest), *parsed);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, user.address());
}

TEST(crypto_signer, authorization_recovers_to_authority) {
  auto user = waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  auto request = waypoint::schema::authorization_request_t{
      .address = waypoint::testing::make_address(0x11),
      .chain_id = waypoint::testing::kChainA,
      .nonce = 7};
  auto authorization = user.sign_authorization(request);

  EXPECT_EQ(waypoint::schema::make_authorization_request(authorization),
            request);
  EXPECT_LE(authorization.s, kHalfOrder);
  EXPECT_EQ(waypoint::crypto::recover_authority(authorization), user.address());

  auto replayed = authorization;
  replayed.nonce = 8;
  EXPECT_NE(waypoint::crypto::recover_authority(replayed), user.address());
}

TEST(crypto_signer, recover_authority_rejects_zero_signature) {
  auto authorization = waypoint::schema::authorization_t{
      .address = waypoint::testing::make_address(0x11),
      .chain_id = 1,
      .nonce = 0,
      .y_parity = 0,
      .r = 0,
      .s = 0};
  EXPECT_THROW(waypoint::crypto::recover_authority(authorization),
               waypoint::common::error);
}
