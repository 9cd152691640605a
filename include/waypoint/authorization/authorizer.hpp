#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/crypto/signer.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/primitives.hpp>

#include <boost/asio/awaitable.hpp>

namespace waypoint::authorization {

/// Both delegations a leg needs on one chain. Neither member is optional.
struct chain_authorizations_t final {
  waypoint::schema::authorization_t user;
  waypoint::schema::authorization_t solver;
};

/// Order in which the authorizations are attached to the transaction.
waypoint::schema::authorizations_t authorization_list(
    const chain_authorizations_t& authorizations);

/// Unsigned tuple for the user: nonce is the pending transaction count.
waypoint::schema::authorization_request_t user_request(
    const waypoint::schema::chain_id_t& chain_id,
    const waypoint::schema::address_t& delegate,
    uint64_t pending_nonce);

/// Unsigned tuple for the account that also sends the transaction. Sending
/// consumes `pending_nonce` before the authorization list is applied, so the
/// authorization carries the next one.
waypoint::schema::authorization_request_t sender_request(
    const waypoint::schema::chain_id_t& chain_id,
    const waypoint::schema::address_t& delegate,
    uint64_t pending_nonce);

struct expected_authorizations_t final {
  waypoint::schema::chain_id_t chain_id;
  waypoint::schema::address_t delegate;
  waypoint::schema::address_t user;
  waypoint::schema::address_t solver;
  uint64_t user_pending_nonce{};
  uint64_t solver_pending_nonce{};
};

/// Checks chain scope, delegate, signer and nonce of both authorizations.
/// Signer or scope mismatches raise error_code::validation; nonces that no
/// longer match the chain raise error_code::stale_authorization.
void validate_chain_authorizations(
    const chain_authorizations_t& authorizations,
    const expected_authorizations_t& expected);

/// Signs EIP-7702 delegations to one delegate contract with fresh nonces.
class authorizer final {
 public:
  explicit authorizer(waypoint::schema::address_t delegate);

  const waypoint::schema::address_t& delegate() const { return delegate_; }

  boost::asio::awaitable<waypoint::schema::authorization_t> authorize_user(
      waypoint::chain::client& chain,
      const waypoint::crypto::signer& user) const;

  boost::asio::awaitable<waypoint::schema::authorization_t> authorize_sender(
      waypoint::chain::client& chain,
      const waypoint::crypto::signer& sender) const;

  boost::asio::awaitable<chain_authorizations_t> authorize(
      waypoint::chain::client& chain,
      const waypoint::crypto::signer& user,
      const waypoint::crypto::signer& solver) const;

  /// Fetches fresh nonces and validates against them.
  boost::asio::awaitable<void> validate(
      waypoint::chain::client& chain,
      const chain_authorizations_t& authorizations,
      const waypoint::schema::address_t& user,
      const waypoint::schema::address_t& solver) const;

 private:
  waypoint::schema::address_t delegate_;
};

}  // namespace waypoint::authorization
