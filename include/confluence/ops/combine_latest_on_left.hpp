#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/clock.hpp>
#include <confluence/ops/combine_latest.hpp>
#include <confluence/ops/filter.hpp>
#include <confluence/ops/map.hpp>
#include <confluence/ops/timestamp.hpp>
#include <type_traits>
#include <utility>

namespace confluence {

// combine_latest_on_left(left, right, f[, clk]): emits f(l, latestRight) for
// left events, pairing each with the most recent right value.
//
// Both sides are timestamped on arrival and combined as latest pairs; a pair
// passes only when left.timestamp >= right.timestamp. Consequences:
// - nothing is emitted (and f is not called) before the first right value;
// - a right event emitted at the same instant as the last left event (or
//   under a clock that goes backwards) passes as well and re-emits with the
//   old left value.
// Errors on either side fail fast; completes once both sides completed.
// f is invoked as const: keep mutable state behind a pointer or reference.
// IMPORTANT: clk must outlive the subscription!
template <class L, class R, class F>
auto combine_latest_on_left(const observable<L>& left, const observable<R>& right, F f,
                            time_source& clk = default_time_source()) {
  static_assert(std::is_invocable_v<const F&, const L&, const R&>,
                "confluence::combine_latest_on_left: f must be callable as const with (const L&, const R&); "
                "a mutable lambda is not");
  using pair_t = std::pair<timestamped<L>, timestamped<R>>;

  auto latest = combine_latest(left | timestamp(clk), right | timestamp(clk),
    [](const timestamped<L>& l, const timestamped<R>& r){ return pair_t{l, r}; });

  return latest
    | filter([](const pair_t& p){ return p.first.timestamp >= p.second.timestamp; })
    | map([f = std::move(f)](const pair_t& p){ return f(p.first.value, p.second.value); });
}

} // namespace confluence
