#pragma once
#include <functional>
#include <utility>
#include <exception>
#include <confluence/core/subscription.hpp>

namespace confluence {

template <class T>
struct observer {
  std::function<void(const T&)> on_next;
  std::function<void(std::exception_ptr)> on_error;
  std::function<void()> on_completed;
};

template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;
  using OnErr  = std::function<void(std::exception_ptr)>;
  using OnDone = std::function<void()>;
  using impl_fn = std::function<subscription(OnNext, OnErr, OnDone)>;

  // Factory: the function runs once per subscribe() and returns the handle
  // that stops the delivery.
  static observable create(impl_fn impl) {
    return observable(std::move(impl));
  }

  // Every call starts an independent consumption of the source.
  subscription subscribe(OnNext on_next,
                         OnErr  on_err  = {},
                         OnDone on_done = {}) const {
    return impl_(std::move(on_next), std::move(on_err), std::move(on_done));
  }

  subscription subscribe(const observer<T>& o) const {
    return impl_(o.on_next, o.on_error, o.on_completed);
  }

private:
  explicit observable(impl_fn impl)
    : impl_(std::move(impl)) {}

  impl_fn impl_;
};

// src | op  ==  op(src)
template <class T, class Op>
auto operator|(const observable<T>& src, Op&& op) -> decltype(std::forward<Op>(op)(src)) {
  return std::forward<Op>(op)(src);
}

} // namespace confluence
