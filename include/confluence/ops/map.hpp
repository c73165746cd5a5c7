#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace confluence {

// map(f): forwards f(v). If f throws, the exception goes downstream as
// on_error and the upstream is disposed.
template <class F>
struct op_map {
  F f;
  template <class T>
  auto operator()(const observable<T>& src) const {
    using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
    return observable<U>::create([src, f = f](auto on_next, auto on_err, auto on_done){
      auto comp = std::make_shared<composite_subscription>();
      auto failed = std::make_shared<std::atomic<bool>>(false);

      comp->add(src.subscribe(
        [f, on_next, on_err, comp, failed](const T& v){
          if (failed->load(std::memory_order_acquire)) return;
          std::optional<U> out;
          try {
            out.emplace(f(v));
          } catch (...) {
            if (failed->exchange(true, std::memory_order_acq_rel)) return;
            comp->reset();
            if (on_err) on_err(std::current_exception());
            return;
          }
          if (on_next) on_next(*out);
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
template <class F> op_map(F)->op_map<F>;
template <class F> inline auto map(F f){ return op_map<F>{ std::move(f) }; }

} // namespace confluence
