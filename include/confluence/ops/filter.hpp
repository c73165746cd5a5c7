#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <atomic>
#include <memory>
#include <utility>

namespace confluence {

// filter(p): forwards values for which p holds. A throwing predicate fails
// the stream.
template <class Pred>
struct op_filter {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](auto on_next, auto on_err, auto on_done){
      auto comp = std::make_shared<composite_subscription>();
      auto failed = std::make_shared<std::atomic<bool>>(false);

      comp->add(src.subscribe(
        [p, on_next, on_err, comp, failed](const T& v){
          if (failed->load(std::memory_order_acquire)) return;
          bool pass = false;
          try {
            pass = static_cast<bool>(p(v));
          } catch (...) {
            if (failed->exchange(true, std::memory_order_acq_rel)) return;
            comp->reset();
            if (on_err) on_err(std::current_exception());
            return;
          }
          if (pass && on_next) on_next(v);
        },
        [on_err, failed](std::exception_ptr e){
          if (failed->load(std::memory_order_acquire)) return;
          if (on_err) on_err(e);
        },
        [on_done, failed]{
          if (failed->load(std::memory_order_acquire)) return;
          if (on_done) on_done();
        }
      ));
      return subscription([comp]{ comp->reset(); });
    });
  }
};
template <class Pred> op_filter(Pred)->op_filter<Pred>;
template <class Pred> inline auto filter(Pred p){ return op_filter<Pred>{ std::move(p) }; }

} // namespace confluence
