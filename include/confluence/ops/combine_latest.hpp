#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/subscription.hpp>
#include <confluence/core/composite_subscription.hpp>
#include <memory>
#include <optional>
#include <mutex>
#include <type_traits>
#include <utility>

namespace confluence {

// combine_latest(oa, ob, f): once both sides have a value, every new event
// from either side emits f(latestA, latestB).
// Completes when BOTH sources have completed. The first error (from a source
// or from f) terminates immediately and disposes the other side.
template <class A, class B, class F>
auto combine_latest(const observable<A>& oa, const observable<B>& ob, F f) {
  using R = std::decay_t<std::invoke_result_t<F&, const A&, const B&>>;
  auto fn = std::make_shared<F>(std::move(f));

  return observable<R>::create([oa, ob, fn](auto on_next, auto on_err, auto on_done){
    struct state_t {
      std::mutex m;
      std::optional<A> lastA;
      std::optional<B> lastB;
      bool doneA{false};
      bool doneB{false};
      bool terminated{false};
    };
    auto st = std::make_shared<state_t>();
    auto comp = std::make_shared<composite_subscription>();

    auto fail = [st, comp, on_err](std::exception_ptr e){
      {
        std::lock_guard<std::mutex> lock(st->m);
        if (st->terminated) return;
        st->terminated = true;
      }
      comp->reset();
      if (on_err) on_err(e);
    };

    // f runs under the lock so that a pair is never combined half-updated
    auto update = [st, fn, on_next, fail](auto&& store){
      std::optional<R> out;
      std::exception_ptr ex;
      {
        std::lock_guard<std::mutex> lock(st->m);
        if (st->terminated) return;
        store(*st);
        if (st->lastA && st->lastB) {
          try {
            out.emplace((*fn)(*st->lastA, *st->lastB));
          } catch (...) {
            ex = std::current_exception();
          }
        }
      }
      if (ex) { fail(ex); return; }
      if (out && on_next) on_next(*out);
    };

    auto complete_side = [st, comp, on_done](bool left){
      {
        std::lock_guard<std::mutex> lock(st->m);
        if (st->terminated) return;
        (left ? st->doneA : st->doneB) = true;
        if (!(st->doneA && st->doneB)) return;
        st->terminated = true;
      }
      if (on_done) on_done();
      comp->reset();
    };

    comp->add(oa.subscribe(
      [update](const A& a){ update([&a](state_t& s){ s.lastA = a; }); },
      fail,
      [complete_side]{ complete_side(true); }
    ));

    comp->add(ob.subscribe(
      [update](const B& b){ update([&b](state_t& s){ s.lastB = b; }); },
      fail,
      [complete_side]{ complete_side(false); }
    ));

    return subscription([st, comp]{
      { std::lock_guard<std::mutex> lock(st->m); st->terminated = true; }
      comp->reset();
    });
  });
}

} // namespace confluence
