#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/clock.hpp>

namespace confluence {

template <class T>
struct timestamped {
  T value;
  instant timestamp;
};

// timestamp(clk): tags every value with clk.now() at arrival.
// IMPORTANT: clk must outlive the subscription!
struct op_timestamp {
  time_source* clk;

  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<timestamped<T>>::create([src, clk = clk](auto on_next, auto on_err, auto on_done){
      return src.subscribe(
        [clk, on_next](const T& v){
          if (on_next) on_next(timestamped<T>{v, clk->now()});
        },
        on_err, on_done
      );
    });
  }
};

inline auto timestamp(time_source& clk = default_time_source()) { return op_timestamp{ &clk }; }

} // namespace confluence
