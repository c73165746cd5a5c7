#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <confluence/core/scheduler.hpp>
#include <confluence/core/log.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace confluence {

struct timeout_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// timeout(d[, ex]): if the source sends no notification at all within d,
// dispose it and fail with timeout_error. The first notification disarms the
// watchdog; everything after it passes through untouched.
// The error is posted on ex when given, otherwise raised on the watchdog
// thread. IMPORTANT: ex must outlive the subscription!
template <class Rep, class Period>
struct op_timeout {
  std::chrono::duration<Rep, Period> d;
  executor* ex;

  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, d = d, ex = ex](auto on_next, auto on_err, auto on_done){
      enum phase : int { armed, disarmed, fired };
      auto state = std::make_shared<std::atomic<int>>(armed);
      auto comp = std::make_shared<composite_subscription>();

      // returns false once the watchdog won
      auto pass = [state]{
        int expected = armed;
        if (state->compare_exchange_strong(expected, disarmed, std::memory_order_acq_rel)) return true;
        return expected == disarmed;
      };

      std::thread([state, comp, d, ex, on_err]{
        std::this_thread::sleep_for(d);
        int expected = armed;
        if (!state->compare_exchange_strong(expected, fired, std::memory_order_acq_rel)) return;
        logging::logger()->debug("timeout: no notification within {}ms",
                             std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
        comp->reset();
        auto raise = [on_err]{
          if (on_err) on_err(std::make_exception_ptr(timeout_error("confluence::timeout")));
        };
        if (ex) ex->post(raise); else raise();
      }).detach();

      comp->add(src.subscribe(
        [pass, on_next](const T& v){ if (pass() && on_next) on_next(v); },
        [pass, on_err](std::exception_ptr e){ if (pass() && on_err) on_err(e); },
        [pass, on_done]{ if (pass() && on_done) on_done(); }
      ));

      return subscription([state, comp]{
        // a disposed subscription must not time out later
        state->store(fired, std::memory_order_release);
        comp->reset();
      });
    });
  }
};

template <class Rep, class Period>
inline auto timeout(std::chrono::duration<Rep, Period> d) {
  return op_timeout<Rep, Period>{ d, nullptr };
}

template <class Rep, class Period>
inline auto timeout(std::chrono::duration<Rep, Period> d, executor& ex) {
  return op_timeout<Rep, Period>{ d, &ex };
}

} // namespace confluence
