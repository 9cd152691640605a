#include <waypoint/authorization/authorizer.hpp>
#include <waypoint/crypto/keccak.hpp>
#include <waypoint/crypto/verify.hpp>
#include <waypoint/encoding/abi/encoder.hpp>
#include <waypoint/intent/builder.hpp>
#include <waypoint/intent/digest.hpp>
#include <waypoint/intent/disclosure.hpp>
#include <waypoint/solver/orchestrator.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace waypoint::solver {

namespace {

std::string describe(const leg_result_t& result) {
  return "chain " + waypoint::schema::to_decimal(result.chain_id);
}

}  // namespace

orchestrator::orchestrator(waypoint::crypto::signer solver,
                           waypoint::schema::address_t user,
                           orchestrator_options_t options)
    : solver_{std::move(solver)}, user_{user}, options_{options} {}

waypoint::schema::bytes_t orchestrator::build_calldata(
    const waypoint::schema::intent_authorization_t& intent,
    const waypoint::schema::chain_id_t& chain_id,
    const waypoint::schema::calls_t& prefund_calls) const {
  auto disclosed = waypoint::schema::intent_authorization_t{
      .signature = intent.signature,
      .chain_batches = waypoint::intent::select_chain_for_chain_batches(
          intent.chain_batches,
          waypoint::schema::chain_selector_t{.chain_id = chain_id})};

  auto calls = prefund_calls;
  calls.push_back(waypoint::schema::call_t{
      .to = user_,
      .value = 0,
      .data = waypoint::encoding::abi::encode_execute(disclosed)});
  return waypoint::encoding::abi::encode_self_execute(calls);
}

boost::asio::awaitable<void> orchestrator::run_leg(
    const waypoint::schema::intent_authorization_t& intent,
    const leg_t& leg,
    cancellation* cancel,
    leg_result_t& result) const {
  auto& chain = *leg.chain;
  result.chain_id = co_await chain.chain_id();

  auto batches =
      waypoint::intent::batches_for_chain(intent.chain_batches, result.chain_id);
  if (batches.empty()) {
    waypoint::common::raise(waypoint::common::error_code::validation,
                            describe(result) + " has no batch in the intent");
  }
  for (const auto& batch : batches) {
    if (!waypoint::intent::verify_chain_batch(batch)) {
      waypoint::common::raise(
          waypoint::common::error_code::validation,
          describe(result) + " calls do not match committed hash " +
              waypoint::schema::to_hex_prefixed(batch.hash));
    }
  }
  auto digest = waypoint::intent::get_intent_hash(intent.chain_batches);
  if (!waypoint::crypto::verify_intent_signature(
          digest, waypoint::schema::make_bytes_view(intent.signature),
          user_)) {
    waypoint::common::raise(waypoint::common::error_code::signature,
                            "intent signature was not made by " +
                                waypoint::crypto::to_checksum_address(user_));
  }

  auto watermark = std::max_element(std::begin(batches), std::end(batches),
                                    [](const auto& lhs, const auto& rhs) {
                                      return lhs.recent_block <
                                             rhs.recent_block;
                                    })
                       ->recent_block;
  spdlog::info("{} waiting for head > {}", describe(result),
               waypoint::schema::to_decimal(watermark));
  auto head =
      co_await wait_for_watermark(chain, watermark, options_.watermark, cancel);

  result.status = waypoint::schema::leg_status_t::submit;
  spdlog::info("{} head {} passed watermark, submitting", describe(result),
               waypoint::schema::to_decimal(head));

  auto authorizer = waypoint::authorization::authorizer{leg.delegate};
  auto solver_authorization =
      co_await authorizer.authorize_sender(chain, solver_);
  auto authorizations = waypoint::authorization::chain_authorizations_t{
      .user = leg.user_authorization, .solver = solver_authorization};
  co_await authorizer.validate(chain, authorizations, user_,
                               solver_.address());

  auto request = waypoint::schema::transaction_request_t{
      .to = solver_.address(),
      .value = 0,
      .data = build_calldata(intent, result.chain_id, leg.prefund_calls),
      .authorization_list =
          waypoint::authorization::authorization_list(authorizations)};
  auto transaction_hash = co_await chain.send_transaction(solver_, request);
  result.transaction_hash = transaction_hash;
  spdlog::info("{} submitted {}", describe(result),
               waypoint::schema::to_hex_prefixed(transaction_hash));

  auto receipt = co_await chain.wait_for_receipt(
      transaction_hash, options_.receipt_poll_interval);
  if (!receipt.success) {
    waypoint::common::raise(
        waypoint::common::error_code::execution_revert,
        "transaction " + waypoint::schema::to_hex_prefixed(transaction_hash) +
            " reverted in block " + std::to_string(receipt.block_number));
  }
  result.status = waypoint::schema::leg_status_t::confirmed;
  spdlog::info("{} confirmed in block {} (gas {})", describe(result),
               receipt.block_number, receipt.gas_used);
}

boost::asio::awaitable<leg_result_t> orchestrator::execute_leg(
    const waypoint::schema::intent_authorization_t& intent,
    const leg_t& leg,
    cancellation* cancel) const {
  auto result = leg_result_t{};
  try {
    co_await run_leg(intent, leg, cancel, result);
  } catch (const waypoint::common::error& e) {
    spdlog::error("{} failed during {}: [{}] {}", describe(result),
                  waypoint::schema::to_string(result.status),
                  waypoint::common::to_string(e.code()), e.what());
    result.status = waypoint::schema::leg_status_t::failed;
    result.error = e.code();
    result.message = e.what();
  } catch (const std::exception& e) {
    spdlog::error("{} failed during {}: {}", describe(result),
                  waypoint::schema::to_string(result.status), e.what());
    result.status = waypoint::schema::leg_status_t::failed;
    result.message = e.what();
  }
  co_return result;
}

boost::asio::awaitable<std::vector<leg_result_t>> orchestrator::execute_intent(
    const waypoint::schema::intent_authorization_t& intent,
    const std::vector<leg_t>& legs,
    cancellation* cancel) const {
  auto executor = co_await boost::asio::this_coro::executor;
  auto results = std::vector<leg_result_t>(legs.size());
  auto failure = std::exception_ptr{};
  auto remaining = legs.size();
  auto done = boost::asio::steady_timer{executor};
  done.expires_at(boost::asio::steady_timer::time_point::max());

  for (std::size_t i = 0; i < legs.size(); ++i) {
    boost::asio::co_spawn(
        executor, execute_leg(intent, legs[i], cancel),
        [&, i](std::exception_ptr error, leg_result_t result) {
          if (error) {
            if (!failure) {
              failure = error;
            }
          } else {
            results[i] = std::move(result);
          }
          if (--remaining == 0) {
            done.cancel();
          }
        });
  }

  if (remaining > 0) {
    auto ec = boost::system::error_code{};
    co_await done.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }
  if (failure) {
    std::rethrow_exception(failure);
  }

  auto confirmed = std::count_if(
      std::begin(results), std::end(results), [](const auto& result) {
        return result.status == waypoint::schema::leg_status_t::confirmed;
      });
  spdlog::info("intent finished: {}/{} legs confirmed", confirmed,
               results.size());
  co_return results;
}

}  // namespace waypoint::solver
