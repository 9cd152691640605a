#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/common/error.hpp>
#include <waypoint/crypto/signer.hpp>
#include <waypoint/schema/authorization.hpp>
#include <waypoint/schema/call.hpp>
#include <waypoint/schema/intent_authorization.hpp>
#include <waypoint/schema/leg_status.hpp>
#include <waypoint/solver/cancellation.hpp>
#include <waypoint/solver/watermark.hpp>

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace waypoint::solver {

/// One chain of an intent, as the solver sees it.
struct leg_t final {
  std::shared_ptr<waypoint::chain::client> chain;
  // Delegate contract both accounts delegate to on this chain.
  waypoint::schema::address_t delegate;
  // Signed by the user ahead of time with their pending nonce.
  waypoint::schema::authorization_t user_authorization;
  // Executed by the solver's account ahead of the user's `execute`, e.g. to
  // fund the user with native value.
  waypoint::schema::calls_t prefund_calls;
};

struct leg_result_t final {
  waypoint::schema::chain_id_t chain_id;
  waypoint::schema::leg_status_t status{
      waypoint::schema::leg_status_t::wait_for_watermark};
  std::optional<waypoint::common::error_code> error;
  std::string message;
  std::optional<waypoint::schema::hash32_t> transaction_hash;
};

struct orchestrator_options_t final {
  watermark_options_t watermark;
  std::chrono::milliseconds receipt_poll_interval{3000};
};

/// Drives each leg through WAIT_FOR_WATERMARK -> SUBMIT -> {CONFIRMED,
/// FAILED}. Legs are independent; there is no rollback when some fail.
class orchestrator final {
 public:
  orchestrator(waypoint::crypto::signer solver,
               waypoint::schema::address_t user,
               orchestrator_options_t options = {});

  /// Runs one leg to a terminal state. Every failure is reported in the
  /// result; `error` is empty when the failure was not a protocol error.
  boost::asio::awaitable<leg_result_t> execute_leg(
      const waypoint::schema::intent_authorization_t& intent,
      const leg_t& leg,
      cancellation* cancel = nullptr) const;

  /// Runs every leg concurrently on the calling coroutine's executor and
  /// returns their results in leg order.
  boost::asio::awaitable<std::vector<leg_result_t>> execute_intent(
      const waypoint::schema::intent_authorization_t& intent,
      const std::vector<leg_t>& legs,
      cancellation* cancel = nullptr) const;

  /// selfExecute calldata for one chain: the prefund calls followed by
  /// `user.execute(signature, disclosed batches)`.
  waypoint::schema::bytes_t build_calldata(
      const waypoint::schema::intent_authorization_t& intent,
      const waypoint::schema::chain_id_t& chain_id,
      const waypoint::schema::calls_t& prefund_calls) const;

  const waypoint::crypto::signer& solver() const { return solver_; }
  const waypoint::schema::address_t& user() const { return user_; }

 private:
  boost::asio::awaitable<void> run_leg(
      const waypoint::schema::intent_authorization_t& intent,
      const leg_t& leg,
      cancellation* cancel,
      leg_result_t& result) const;

  waypoint::crypto::signer solver_;
  waypoint::schema::address_t user_;
  orchestrator_options_t options_;
};

}  // namespace waypoint::solver
