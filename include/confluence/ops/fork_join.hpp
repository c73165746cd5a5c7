#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/subscription.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <confluence/core/log.hpp>
#include <confluence/ops/last.hpp>
#include <confluence/ops/map.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace confluence {

// Final value of one fork_join input, tagged with the input's position.
template <class T>
struct indexed {
  std::size_t index;
  T value;
};

namespace detail {

// Barrier shared by one fork_join subscription. Every input writes its slot
// once; the stream terminates exactly once, on the first error or when the
// last slot is filled.
template <class Slots>
struct fork_join_state {
  std::mutex m;
  Slots results{};
  std::size_t count{0};
  bool terminated{false};
  composite_subscription subs;

  bool is_terminated() {
    std::lock_guard<std::mutex> lock(m);
    return terminated;
  }

  // true if this call won the right to deliver the error
  bool claim_error() {
    std::lock_guard<std::mutex> lock(m);
    if (terminated) return false;
    terminated = true;
    return true;
  }

  void dispose() {
    {
      std::lock_guard<std::mutex> lock(m);
      terminated = true;
    }
    subs.reset();
  }
};

template <class State, class OnErr>
auto fork_join_on_error(std::shared_ptr<State> st, std::size_t index, OnErr on_err) {
  return [st, index, on_err](std::exception_ptr e){
    if (!st->claim_error()) return;
    logging::logger()->debug("fork_join: source {} failed, disposing the others", index);
    st->subs.reset();
    if (on_err) on_err(e);
  };
}

// Liveness diagnostics only: a source that completes without a value keeps
// the barrier from ever opening.
template <class State, class Written>
auto fork_join_on_completed(std::shared_ptr<State> st, std::size_t index, Written written) {
  return [st, index, written]{
    std::lock_guard<std::mutex> lock(st->m);
    if (st->terminated || written(st->results)) return;
    logging::logger()->debug("fork_join: source {} completed without a value, the join cannot emit", index);
  };
}

template <class... Ts, std::size_t... Is>
subscription subscribe_fork_join(const std::tuple<observable<Ts>...>& sources,
                                 typename observable<std::tuple<Ts...>>::OnNext on_next,
                                 typename observable<std::tuple<Ts...>>::OnErr on_err,
                                 typename observable<std::tuple<Ts...>>::OnDone on_done,
                                 std::index_sequence<Is...>) {
  constexpr std::size_t n = sizeof...(Ts);
  using state_t = fork_join_state<std::tuple<std::optional<Ts>...>>;
  auto st = std::make_shared<state_t>();

  logging::logger()->debug("fork_join: subscribing to {} sources", n);

  auto subscribe_one = [&](auto index_c){
    constexpr std::size_t I = decltype(index_c)::value;
    using V = std::tuple_element_t<I, std::tuple<Ts...>>;
    if (st->is_terminated()) return;

    auto tagged = std::get<I>(sources)
      | last()
      | map([](const V& v){ return indexed<V>{I, v}; });

    st->subs.add(tagged.subscribe(
      [st, on_next, on_done](const indexed<V>& r){
        std::optional<std::tuple<Ts...>> out;
        {
          std::lock_guard<std::mutex> lock(st->m);
          auto& slot = std::get<I>(st->results);
          if (st->terminated || slot) return;
          slot = r.value;
          if (++st->count == sizeof...(Ts)) {
            st->terminated = true;
            out.emplace(std::move(*std::get<Is>(st->results))...);
          }
        }
        if (!out) return;
        logging::logger()->debug("fork_join: all {} sources delivered", sizeof...(Ts));
        if (on_next) on_next(*out);
        if (on_done) on_done();
        st->subs.reset();
      },
      fork_join_on_error(st, I, on_err),
      fork_join_on_completed(st, I, [](const auto& results){
        return std::get<I>(results).has_value();
      })
    ));
  };
  (subscribe_one(std::integral_constant<std::size_t, Is>{}), ...);

  return subscription([st]{ st->dispose(); });
}

} // namespace detail

// fork_join(sources): subscribes to every source, keeps each one's final
// value and, once all of them completed, emits the values ordered by source
// position, then completes.
// - any error fails the result at once and disposes the other sources;
// - a source that completes without a value means the result never
//   terminates. Guard with timeout() where that matters.
template <class T>
observable<std::vector<T>> fork_join(std::vector<observable<T>> sources) {
  if (sources.empty())
    throw std::invalid_argument("confluence::fork_join: at least one source is required");

  return observable<std::vector<T>>::create([sources = std::move(sources)](auto on_next, auto on_err, auto on_done){
    const std::size_t n = sources.size();
    using state_t = detail::fork_join_state<std::vector<std::optional<T>>>;
    auto st = std::make_shared<state_t>();
    st->results.resize(n);

    logging::logger()->debug("fork_join: subscribing to {} sources", n);

    for (std::size_t i = 0; i < n; ++i) {
      // a source that failed synchronously spares the rest a subscription
      if (st->is_terminated()) break;

      auto tagged = sources[i]
        | last()
        | map([i](const T& v){ return indexed<T>{i, v}; });

      st->subs.add(tagged.subscribe(
        [st, n, on_next, on_done](const indexed<T>& r){
          std::optional<std::vector<T>> out;
          {
            std::lock_guard<std::mutex> lock(st->m);
            auto& slot = st->results[r.index];
            if (st->terminated || slot) return;
            slot = r.value;
            if (++st->count == n) {
              st->terminated = true;
              out.emplace();
              out->reserve(n);
              for (auto& v : st->results) out->push_back(std::move(*v));
            }
          }
          if (!out) return;
          logging::logger()->debug("fork_join: all {} sources delivered", n);
          if (on_next) on_next(*out);
          if (on_done) on_done();
          st->subs.reset();
        },
        detail::fork_join_on_error(st, i, on_err),
        detail::fork_join_on_completed(st, i, [i](const auto& results){
          return results[i].has_value();
        })
      ));
    }

    return subscription([st]{ st->dispose(); });
  });
}

template <class... Ts>
observable<std::tuple<Ts...>> fork_join(std::tuple<observable<Ts>...> sources) {
  static_assert(sizeof...(Ts) > 0, "confluence::fork_join: at least one source is required");

  return observable<std::tuple<Ts...>>::create([sources = std::move(sources)](auto on_next, auto on_err, auto on_done){
    return detail::subscribe_fork_join(sources, std::move(on_next), std::move(on_err), std::move(on_done),
                                       std::index_sequence_for<Ts...>{});
  });
}

} // namespace confluence
