#pragma once

#include <waypoint/chain/client.hpp>
#include <waypoint/schema/primitives.hpp>
#include <waypoint/solver/cancellation.hpp>

#include <boost/asio/awaitable.hpp>

#include <chrono>

namespace waypoint::solver {

struct watermark_options_t final {
  std::chrono::milliseconds poll_interval{3000};
  // Zero waits without bound.
  std::chrono::milliseconds timeout{0};
};

/// Poll the chain head until it is strictly greater than `recent_block` and
/// return the head that satisfied it.
///
/// Raises error_code::watermark_timeout once `options.timeout` elapses and
/// error_code::cancelled when `cancel` fires.
boost::asio::awaitable<waypoint::schema::block_number_t> wait_for_watermark(
    waypoint::chain::client& chain,
    const waypoint::schema::block_number_t& recent_block,
    const watermark_options_t& options,
    cancellation* cancel = nullptr);

}  // namespace waypoint::solver
