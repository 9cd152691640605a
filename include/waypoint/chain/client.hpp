#pragma once

#include <waypoint/crypto/signer.hpp>
#include <waypoint/schema/primitives.hpp>
#include <waypoint/schema/transaction.hpp>

#include <boost/asio/awaitable.hpp>

#include <chrono>

namespace waypoint::chain {

/// Read/write access to a single chain.
class client {
 public:
  virtual ~client() = default;

  virtual boost::asio::awaitable<waypoint::schema::chain_id_t> chain_id() = 0;
  virtual boost::asio::awaitable<waypoint::schema::block_number_t>
  block_number() = 0;
  /// Pending transaction count of `address`.
  virtual boost::asio::awaitable<uint64_t> transaction_count(
      const waypoint::schema::address_t& address) = 0;
  /// Build, sign and broadcast a contract write from `sender`. Returns the
  /// transaction hash.
  virtual boost::asio::awaitable<waypoint::schema::hash32_t> send_transaction(
      const waypoint::crypto::signer& sender,
      const waypoint::schema::transaction_request_t& request) = 0;
  virtual boost::asio::awaitable<waypoint::schema::transaction_receipt_t>
  wait_for_receipt(const waypoint::schema::hash32_t& transaction_hash,
                   std::chrono::milliseconds poll_interval) = 0;
};

}  // namespace waypoint::chain
