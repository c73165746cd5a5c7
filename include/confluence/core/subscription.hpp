#pragma once
#include <exception>
#include <functional>
#include <utility>
#include <type_traits>
#include <confluence/core/log.hpp>

namespace confluence {

// RAII handle of an active consumption of a source.
// - Move-only: one subscription, one owner, one dispose.
// - The destructor disposes unless the handle was released or moved from.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn, bool cancel_on_dtor = true) noexcept
    : cancel_(std::move(fn)), cancel_on_dtor_(cancel_on_dtor) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::move(other.cancel_))
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.cancel_ = nullptr;
    other.cancel_on_dtor_ = false;
  }

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::move(other.cancel_);
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.cancel_ = nullptr;
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subscription() {
    if (cancel_on_dtor_) reset();
  }

  // Disposes once. Repeated calls are no-op.
  // reset() also runs from destructors, so a throwing cancel function is
  // reported to the log instead of being rethrown.
  void reset() noexcept {
    if (cancel_) {
      auto fn = std::move(cancel_);
      cancel_ = nullptr;
      try {
        fn();
      } catch (const std::exception& e) {
        logging::logger()->warn("subscription cancel threw: {}", e.what());
      } catch (...) {
        logging::logger()->warn("subscription cancel threw a non-standard exception");
      }
    }
    cancel_on_dtor_ = false;
  }

  // Forget the cancel function; responsibility moved elsewhere.
  void release() noexcept {
    cancel_ = nullptr;
    cancel_on_dtor_ = false;
  }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

private:
  cancel_fn cancel_{};
  bool cancel_on_dtor_{true};
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline subscription make_subscription(F&& f, bool cancel_on_dtor = true) {
  return subscription(subscription::cancel_fn(std::forward<F>(f)), cancel_on_dtor);
}

} // namespace confluence
