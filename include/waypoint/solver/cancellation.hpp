#pragma once

#include <cstddef>
#include <functional>
#include <map>

namespace waypoint::solver {

/// Cancels the watermark waits of every leg it is handed to.
///
/// Not thread-safe: `cancel` must run on the io_context that drives the legs
/// (post it there from other threads).
class cancellation final {
 public:
  class subscription final {
   public:
    subscription() = default;
    subscription(cancellation* owner, std::size_t id);
    subscription(const subscription&) = delete;
    subscription& operator=(const subscription&) = delete;
    subscription(subscription&& other) noexcept;
    subscription& operator=(subscription&& other) noexcept;
    ~subscription();

   private:
    cancellation* owner_{nullptr};
    std::size_t id_{0};
  };

  void cancel();
  bool cancelled() const { return cancelled_; }

  /// `handler` runs once on cancel(), or never if the returned subscription
  /// is destroyed first.
  [[nodiscard]] subscription subscribe(std::function<void()> handler);

 private:
  void unsubscribe(std::size_t id);

  bool cancelled_{false};
  std::size_t next_id_{1};
  std::map<std::size_t, std::function<void()>> handlers_;
};

}  // namespace waypoint::solver
