#include <gtest/gtest.h>
#include <waypoint/authorization/authorizer.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/verify.hpp>
#include <waypoint/testing/common.hpp>

namespace {

struct authorizer_fixture {
  waypoint::crypto::signer user =
      waypoint::crypto::signer::from_hex(waypoint::testing::kUserKey);
  waypoint::crypto::signer solver =
      waypoint::crypto::signer::from_hex(waypoint::testing::kSolverKey);
  waypoint::schema::address_t delegate = waypoint::testing::make_address(0xde);
  waypoint::testing::fake_chain_client chain{waypoint::testing::kChainA};

  authorizer_fixture() {
    chain.nonces[user.address()] = 4;
    chain.nonces[solver.address()] = 9;
  }

  waypoint::authorization::expected_authorizations_t expected() const {
    return waypoint::authorization::expected_authorizations_t{
        .chain_id = waypoint::testing::kChainA,
        .delegate = delegate,
        .user = user.address(),
        .solver = solver.address(),
        .user_pending_nonce = 4,
        .solver_pending_nonce = 9};
  }

  waypoint::authorization::chain_authorizations_t sign() {
    auto authorizer = waypoint::authorization::authorizer{delegate};
    return waypoint::testing::run(authorizer.authorize(chain, user, solver));
  }
};

waypoint::common::error_code validation_error(
    const waypoint::authorization::chain_authorizations_t& authorizations,
    const waypoint::authorization::expected_authorizations_t& expected) {
  try {
    waypoint::authorization::validate_chain_authorizations(authorizations,
                                                           expected);
  } catch (const waypoint::common::error& e) {
    return e.code();
  }
  ADD_FAILURE() << "authorizations unexpectedly validated";
  return waypoint::common::error_code::rpc;
}

}  // namespace

TEST(authorizer, request_nonces_account_for_sender) {
  auto user = waypoint::authorization::user_request(
      waypoint::testing::kChainA, waypoint::testing::make_address(0xde), 4);
  auto sender = waypoint::authorization::sender_request(
      waypoint::testing::kChainA, waypoint::testing::make_address(0xde), 4);
  EXPECT_EQ(user.nonce, 4u);
  EXPECT_EQ(sender.nonce, 5u);
  EXPECT_EQ(user.chain_id, waypoint::testing::kChainA);
  EXPECT_EQ(sender.address, waypoint::testing::make_address(0xde));
}

TEST(authorizer, signs_both_delegations_with_fresh_nonces) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();

  EXPECT_EQ(authorizations.user.nonce, 4u);
  EXPECT_EQ(authorizations.solver.nonce, 10u);
  EXPECT_EQ(authorizations.user.address, fixture.delegate);
  EXPECT_EQ(authorizations.solver.chain_id, waypoint::testing::kChainA);
  EXPECT_EQ(waypoint::crypto::recover_authority(authorizations.user),
            fixture.user.address());
  EXPECT_EQ(waypoint::crypto::recover_authority(authorizations.solver),
            fixture.solver.address());

  EXPECT_NO_THROW(waypoint::authorization::validate_chain_authorizations(
      authorizations, fixture.expected()));
}

TEST(authorizer, authorization_list_puts_solver_first) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();
  auto list = waypoint::authorization::authorization_list(authorizations);
  ASSERT_EQ(list.size(), 2u);
  EXPECT_EQ(list[0], authorizations.solver);
  EXPECT_EQ(list[1], authorizations.user);
}

TEST(authorizer, wrong_chain_or_delegate_is_a_validation_error) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();

  auto other_chain = fixture.expected();
  other_chain.chain_id = waypoint::testing::kChainB;
  EXPECT_EQ(validation_error(authorizations, other_chain),
            waypoint::common::error_code::validation);

  auto other_delegate = fixture.expected();
  other_delegate.delegate = waypoint::testing::make_address(0xdf);
  EXPECT_EQ(validation_error(authorizations, other_delegate),
            waypoint::common::error_code::validation);
}

TEST(authorizer, authorization_from_wrong_account_is_rejected) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();

  // Both delegations signed by the user.
  auto swapped = authorizations;
  swapped.solver = fixture.user.sign_authorization(
      waypoint::schema::make_authorization_request(authorizations.solver));
  EXPECT_EQ(validation_error(swapped, fixture.expected()),
            waypoint::common::error_code::validation);
}

TEST(authorizer, advanced_nonces_are_stale) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();

  auto user_moved = fixture.expected();
  user_moved.user_pending_nonce = 5;
  EXPECT_EQ(validation_error(authorizations, user_moved),
            waypoint::common::error_code::stale_authorization);

  auto solver_moved = fixture.expected();
  solver_moved.solver_pending_nonce = 10;
  EXPECT_EQ(validation_error(authorizations, solver_moved),
            waypoint::common::error_code::stale_authorization);
}

TEST(authorizer, validate_reads_nonces_from_chain) {
  auto fixture = authorizer_fixture{};
  auto authorizations = fixture.sign();
  auto authorizer = waypoint::authorization::authorizer{fixture.delegate};

  EXPECT_NO_THROW(waypoint::testing::run(
      authorizer.validate(fixture.chain, authorizations, fixture.user.address(),
                          fixture.solver.address())));

  fixture.chain.nonces[fixture.user.address()] = 5;
  try {
    waypoint::testing::run(authorizer.validate(fixture.chain, authorizations,
                                               fixture.user.address(),
                                               fixture.solver.address()));
    FAIL() << "expected a stale authorization";
  } catch (const waypoint::common::error& e) {
    EXPECT_EQ(e.code(), waypoint::common::error_code::stale_authorization);
  }
}
