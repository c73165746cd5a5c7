#pragma once
#include <cstddef>
#include <vector>
#include <mutex>
#include <confluence/core/subscription.hpp>

namespace confluence {

// Owns the child subscriptions of one combined stream.
// reset() disposes every child exactly once; a child added afterwards is
// disposed on the spot (sources may terminate while we are still subscribing).
class composite_subscription {
public:
  composite_subscription() = default;

  void add(subscription s) {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (!disposed_) {
        subs_.push_back(std::move(s));
        return;
      }
    }
    s.reset();
  }

  void reset() {
    std::vector<subscription> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (disposed_) return;
      disposed_ = true;
      local.swap(subs_);
    }
    for (auto& s : local) s.reset();
  }

  bool disposed() const {
    std::lock_guard<std::mutex> lock(m_);
    return disposed_;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(m_);
    return subs_.size();
  }

  ~composite_subscription() { reset(); }

  composite_subscription(const composite_subscription&)            = delete;
  composite_subscription& operator=(const composite_subscription&) = delete;
  composite_subscription(composite_subscription&&)                 = delete;
  composite_subscription& operator=(composite_subscription&&)      = delete;

private:
  mutable std::mutex m_;
  bool disposed_{false};
  std::vector<subscription> subs_;
};

} // namespace confluence
