#include <waypoint/common/error.hpp>
#include <waypoint/solver/watermark.hpp>

#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace waypoint::solver {

boost::asio::awaitable<waypoint::schema::block_number_t> wait_for_watermark(
    waypoint::chain::client& chain,
    const waypoint::schema::block_number_t& recent_block,
    const watermark_options_t& options,
    cancellation* cancel) {
  using clock = std::chrono::steady_clock;

  auto timer =
      boost::asio::steady_timer{co_await boost::asio::this_coro::executor};
  auto registration = cancel != nullptr
                          ? cancel->subscribe([&timer] { timer.cancel(); })
                          : cancellation::subscription{};
  const auto bounded = options.timeout.count() > 0;
  const auto deadline = clock::now() + options.timeout;

  while (true) {
    if (cancel != nullptr && cancel->cancelled()) {
      waypoint::common::raise(waypoint::common::error_code::cancelled,
                              "watermark wait cancelled");
    }

    auto head = co_await chain.block_number();
    if (head > recent_block) {
      co_return head;
    }

    auto now = clock::now();
    if (bounded && now >= deadline) {
      waypoint::common::raise(
          waypoint::common::error_code::watermark_timeout,
          "chain head " + waypoint::schema::to_decimal(head) +
              " did not pass block " +
              waypoint::schema::to_decimal(recent_block) + " within " +
              std::to_string(options.timeout.count()) + "ms");
    }
    spdlog::trace("head {} <= watermark {}, polling again",
                  waypoint::schema::to_decimal(head),
                  waypoint::schema::to_decimal(recent_block));

    if (cancel != nullptr && cancel->cancelled()) {
      waypoint::common::raise(waypoint::common::error_code::cancelled,
                              "watermark wait cancelled");
    }

    auto wait = bounded ? std::min<clock::duration>(options.poll_interval,
                                                    deadline - now)
                        : clock::duration{options.poll_interval};
    timer.expires_after(wait);
    auto ec = boost::system::error_code{};
    co_await timer.async_wait(
        boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec && ec != boost::asio::error::operation_aborted) {
      waypoint::common::raise(waypoint::common::error_code::transport,
                              "watermark timer failed: " + ec.message());
    }
  }
}

}  // namespace waypoint::solver
