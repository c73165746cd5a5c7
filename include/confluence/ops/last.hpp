#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <memory>
#include <mutex>
#include <optional>

namespace confluence {

// last(): remembers only the most recent value; on completion emits it and
// completes. A source that completes empty completes the result without a
// value (no error).
struct op_last {
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src](auto on_next, auto on_err, auto on_done){
      struct state_t {
        std::mutex m;
        std::optional<T> latest;
        bool terminated{false};
      };
      auto st = std::make_shared<state_t>();
      auto comp = std::make_shared<composite_subscription>();

      comp->add(src.subscribe(
        [st](const T& v){
          std::lock_guard<std::mutex> lock(st->m);
          if (!st->terminated) st->latest = v;
        },
        [st, comp, on_err](std::exception_ptr e){
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->terminated) return;
            st->terminated = true;
            st->latest.reset();
          }
          comp->reset();
          if (on_err) on_err(e);
        },
        [st, comp, on_next, on_done]{
          std::optional<T> out;
          {
            std::lock_guard<std::mutex> lock(st->m);
            if (st->terminated) return;
            st->terminated = true;
            out.swap(st->latest);
          }
          if (out && on_next) on_next(*out);
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

inline auto last() { return op_last{}; }

} // namespace confluence
