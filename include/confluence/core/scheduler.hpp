#pragma once
#include <cstddef>
#include <functional>
#include <queue>
#include <mutex>

namespace confluence {

struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Runs the task on the posting thread, right away.
struct inline_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

// Shared logical timeline: tasks queue up and run one at a time, in post
// order, on whichever thread calls drain(). Tasks posted while draining run
// in the same drain().
class strand final : public executor {
public:
  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  std::size_t drain() {
    std::size_t ran = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front());
        q_.pop();
      }
      f();
      ++ran;
    }
    return ran;
  }

private:
  std::mutex m_;
  std::queue<std::function<void()>> q_;
};

} // namespace confluence
