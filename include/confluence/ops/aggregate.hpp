#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace confluence {

// aggregate(seed, acc): seeded left fold. Emits the accumulated value once,
// when the source completes, then completes. An empty source yields the seed.
// A throwing accumulator fails the stream.
template <class Seed, class Acc>
struct op_aggregate {
  Seed seed;
  Acc acc;

  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<Seed>::create([src, seed = seed, acc = acc](auto on_next, auto on_err, auto on_done){
      struct state_t {
        explicit state_t(Seed s) : value(std::move(s)) {}
        std::mutex m;
        Seed value;
        bool terminated{false};
      };
      auto st = std::make_shared<state_t>(seed);
      auto comp = std::make_shared<composite_subscription>();

      comp->add(src.subscribe(
        [st, acc, comp, on_err](const T& v){
          std::exception_ptr ex;
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->terminated) return;
            try {
              st->value = acc(st->value, v);
              return;
            } catch (...) {
              st->terminated = true;
              ex = std::current_exception();
            }
          }
          comp->reset();
          if (on_err) on_err(ex);
        },
        [st, comp, on_err](std::exception_ptr e){
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->terminated) return;
            st->terminated = true;
          }
          comp->reset();
          if (on_err) on_err(e);
        },
        [st, comp, on_next, on_done]{
          std::optional<Seed> out;
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->terminated) return;
            st->terminated = true;
            out.emplace(std::move(st->value));
          }
          if (on_next) on_next(*out);
          if (on_done) on_done();
          comp->reset();
        }
      ));
      return subscription([st, comp]{
        { std::lock_guard<std::mutex> lock(st->m); st->terminated = true; }
        comp->reset();
      });
    });
  }
};

template <class Seed, class Acc>
inline auto aggregate(Seed seed, Acc acc) {
  return op_aggregate<Seed, Acc>{ std::move(seed), std::move(acc) };
}

} // namespace confluence
