#include <waypoint/authorization/authorizer.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/verify.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace waypoint::authorization {

namespace {

void check_scope(const waypoint::schema::authorization_t& authorization,
                 const std::string& role,
                 const waypoint::schema::chain_id_t& chain_id,
                 const waypoint::schema::address_t& delegate,
                 const waypoint::schema::address_t& signer) {
  if (authorization.chain_id != chain_id) {
    waypoint::common::raise(
        waypoint::common::error_code::validation,
        role + " authorization is for chain " +
            waypoint::schema::to_decimal(authorization.chain_id) +
            ", expected " + waypoint::schema::to_decimal(chain_id));
  }
  if (authorization.address != delegate) {
    waypoint::common::raise(
        waypoint::common::error_code::validation,
        role + " authorization delegates to " +
            waypoint::crypto::to_checksum_address(authorization.address) +
            ", expected " + waypoint::crypto::to_checksum_address(delegate));
  }
  auto authority = waypoint::crypto::recover_authority(authorization);
  if (authority != signer) {
    waypoint::common::raise(
        waypoint::common::error_code::validation,
        "missing " + role + " authorization: signed by " +
            waypoint::crypto::to_checksum_address(authority) + ", expected " +
            waypoint::crypto::to_checksum_address(signer));
  }
}

void check_nonce(const waypoint::schema::authorization_t& authorization,
                 const std::string& role,
                 const uint64_t expected) {
  if (authorization.nonce != expected) {
    waypoint::common::raise(
        waypoint::common::error_code::stale_authorization,
        role + " authorization nonce " + std::to_string(authorization.nonce) +
            " does not match expected " + std::to_string(expected));
  }
}

}  // namespace

waypoint::schema::authorizations_t authorization_list(
    const chain_authorizations_t& authorizations) {
  return {authorizations.solver, authorizations.user};
}

waypoint::schema::authorization_request_t user_request(
    const waypoint::schema::chain_id_t& chain_id,
    const waypoint::schema::address_t& delegate,
    const uint64_t pending_nonce) {
  return waypoint::schema::authorization_request_t{
      .address = delegate, .chain_id = chain_id, .nonce = pending_nonce};
}

waypoint::schema::authorization_request_t sender_request(
    const waypoint::schema::chain_id_t& chain_id,
    const waypoint::schema::address_t& delegate,
    const uint64_t pending_nonce) {
  return waypoint::schema::authorization_request_t{
      .address = delegate, .chain_id = chain_id, .nonce = pending_nonce + 1};
}

void validate_chain_authorizations(
    const chain_authorizations_t& authorizations,
    const expected_authorizations_t& expected) {
  check_scope(authorizations.user, "user", expected.chain_id,
              expected.delegate, expected.user);
  check_scope(authorizations.solver, "solver", expected.chain_id,
              expected.delegate, expected.solver);
  check_nonce(authorizations.user, "user", expected.user_pending_nonce);
  check_nonce(authorizations.solver, "solver",
              expected.solver_pending_nonce + 1);
}

authorizer::authorizer(waypoint::schema::address_t delegate)
    : delegate_{delegate} {}

boost::asio::awaitable<waypoint::schema::authorization_t>
authorizer::authorize_user(waypoint::chain::client& chain,
                           const waypoint::crypto::signer& user) const {
  auto chain_id = co_await chain.chain_id();
  auto nonce = co_await chain.transaction_count(user.address());
  spdlog::debug("chain {} user {} authorization nonce {}",
                waypoint::schema::to_decimal(chain_id),
                waypoint::crypto::to_checksum_address(user.address()), nonce);
  co_return user.sign_authorization(user_request(chain_id, delegate_, nonce));
}

boost::asio::awaitable<waypoint::schema::authorization_t>
authorizer::authorize_sender(waypoint::chain::client& chain,
                             const waypoint::crypto::signer& sender) const {
  auto chain_id = co_await chain.chain_id();
  auto nonce = co_await chain.transaction_count(sender.address());
  spdlog::debug("chain {} sender {} authorization nonce {}",
                waypoint::schema::to_decimal(chain_id),
                waypoint::crypto::to_checksum_address(sender.address()),
                nonce + 1);
  co_return sender.sign_authorization(
      sender_request(chain_id, delegate_, nonce));
}

boost::asio::awaitable<chain_authorizations_t> authorizer::authorize(
    waypoint::chain::client& chain,
    const waypoint::crypto::signer& user,
    const waypoint::crypto::signer& solver) const {
  auto user_authorization = co_await authorize_user(chain, user);
  auto solver_authorization = co_await authorize_sender(chain, solver);
  co_return chain_authorizations_t{.user = std::move(user_authorization),
                                   .solver = std::move(solver_authorization)};
}

boost::asio::awaitable<void> authorizer::validate(
    waypoint::chain::client& chain,
    const chain_authorizations_t& authorizations,
    const waypoint::schema::address_t& user,
    const waypoint::schema::address_t& solver) const {
  auto chain_id = co_await chain.chain_id();
  auto user_nonce = co_await chain.transaction_count(user);
  auto solver_nonce = co_await chain.transaction_count(solver);
  auto expected = expected_authorizations_t{.chain_id = chain_id,
                                            .delegate = delegate_,
                                            .user = user,
                                            .solver = solver,
                                            .user_pending_nonce = user_nonce,
                                            .solver_pending_nonce =
                                                solver_nonce};
  validate_chain_authorizations(authorizations, expected);
}

}  // namespace waypoint::authorization
