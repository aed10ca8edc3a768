#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace trailfx {

using SubscriptionId = std::uint64_t;

// Explicit publish/subscribe. Handlers run in subscription order.
template <class... Args>
class EventChannel {
public:
  using Handler = std::function<void(Args...)>;

  SubscriptionId subscribe(Handler h) {
    const SubscriptionId id = ++next_id_;
    subs_.push_back(Sub{id, std::move(h)});
    return id;
  }

  // Returns false if id is not subscribed.
  bool unsubscribe(SubscriptionId id) {
    auto it = std::find_if(subs_.begin(), subs_.end(), [&](const Sub& s){ return s.id == id; });
    if (it == subs_.end()) return false;
    subs_.erase(it);
    return true;
  }

  void publish(Args... args) const {
    for (const auto& s : subs_) s.handler(args...);
  }

  std::size_t subscriber_count() const { return subs_.size(); }

private:
  struct Sub {
    SubscriptionId id;
    Handler handler;
  };
  std::vector<Sub> subs_;
  SubscriptionId next_id_{0};
};

} // namespace trailfx
