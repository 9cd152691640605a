#include <waypoint/solver/cancellation.hpp>

#include <utility>

namespace waypoint::solver {

cancellation::subscription::subscription(cancellation* owner, std::size_t id)
    : owner_{owner}, id_{id} {}

cancellation::subscription::subscription(subscription&& other) noexcept
    : owner_{std::exchange(other.owner_, nullptr)}, id_{other.id_} {}

cancellation::subscription& cancellation::subscription::operator=(
    subscription&& other) noexcept {
  if (this != &other) {
    if (owner_ != nullptr) {
      owner_->unsubscribe(id_);
    }
    owner_ = std::exchange(other.owner_, nullptr);
    id_ = other.id_;
  }
  return *this;
}

cancellation::subscription::~subscription() {
  if (owner_ != nullptr) {
    owner_->unsubscribe(id_);
  }
}

void cancellation::cancel() {
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  auto handlers = std::exchange(handlers_, {});
  for (auto& [id, handler] : handlers) {
    handler();
  }
}

cancellation::subscription cancellation::subscribe(
    std::function<void()> handler) {
  if (cancelled_) {
    handler();
    return subscription{};
  }
  auto id = next_id_++;
  handlers_.emplace(id, std::move(handler));
  return subscription{this, id};
}

void cancellation::unsubscribe(std::size_t id) {
  handlers_.erase(id);
}

}  // namespace waypoint::solver
