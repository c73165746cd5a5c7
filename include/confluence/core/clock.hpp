#pragma once
#include <atomic>
#include <chrono>

namespace confluence {

using instant = std::chrono::system_clock::time_point;

// Time source for timestamp(). Implementations must be safe to call from
// any thread.
struct time_source {
  virtual ~time_source() = default;
  virtual instant now() const = 0;
};

// Wall clock.
struct system_time final : time_source {
  instant now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to (tests, replays).
class manual_clock final : public time_source {
public:
  manual_clock() = default;
  explicit manual_clock(instant start) : ticks_(start.time_since_epoch().count()) {}

  instant now() const override {
    return instant(instant::duration(ticks_.load(std::memory_order_acquire)));
  }

  void set(instant t) {
    ticks_.store(t.time_since_epoch().count(), std::memory_order_release);
  }

  template <class Rep, class Period>
  void advance(std::chrono::duration<Rep, Period> d) {
    auto step = std::chrono::duration_cast<instant::duration>(d).count();
    ticks_.fetch_add(step, std::memory_order_acq_rel);
  }

private:
  std::atomic<instant::rep> ticks_{0};
};

inline time_source& default_time_source() {
  static system_time wall;
  return wall;
}

} // namespace confluence
