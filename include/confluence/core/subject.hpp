#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/subscription.hpp>
#include <cstddef>
#include <mutex>
#include <vector>
#include <optional>

namespace confluence {

// subject<T>: hot source, pushed from outside, fanned out to every current
// observer. A late subscriber to a terminated subject gets the terminal
// notification immediately.
// The subject must outlive the observables taken from it.
template <class T>
class subject {
public:
  using OnNext = typename observable<T>::OnNext;
  using OnErr  = typename observable<T>::OnErr;
  using OnDone = typename observable<T>::OnDone;

  subject() = default;
  subject(const subject&) = delete;
  subject& operator=(const subject&) = delete;

  observable<T> as_observable() {
    return observable<T>::create([this](OnNext on_next, OnErr on_err, OnDone on_done) {
      std::size_t id = 0;
      {
        std::unique_lock<std::mutex> lock(m_);
        if (completed_) {
          lock.unlock();
          if (on_done) on_done();
          return subscription{};
        }
        if (error_) {
          auto e = *error_;
          lock.unlock();
          if (on_err) on_err(e);
          return subscription{};
        }
        id = next_id_++;
        slots_.push_back({id, std::move(on_next), std::move(on_err), std::move(on_done)});
      }

      return subscription([this, id]{
        std::lock_guard<std::mutex> lock(m_);
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
          if (it->id == id) { slots_.erase(it); break; }
        }
      });
    });
  }

  void on_next(const T& v) {
    std::vector<OnNext> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (completed_ || error_) return;
      local.reserve(slots_.size());
      for (auto& s : slots_) local.push_back(s.on_next);
    }
    for (auto& f : local) if (f) f(v);
  }

  void on_error(std::exception_ptr e) {
    std::vector<OnErr> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (completed_ || error_) return;
      error_ = e;
      local.reserve(slots_.size());
      for (auto& s : slots_) local.push_back(s.on_err);
      slots_.clear();
    }
    for (auto& f : local) if (f) f(e);
  }

  void on_completed() {
    std::vector<OnDone> local;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (completed_ || error_) return;
      completed_ = true;
      local.reserve(slots_.size());
      for (auto& s : slots_) local.push_back(s.on_done);
      slots_.clear();
    }
    for (auto& f : local) if (f) f();
  }

  // Number of live subscriptions; disposed ones are gone.
  std::size_t observer_count() const {
    std::lock_guard<std::mutex> lock(m_);
    return slots_.size();
  }

private:
  struct slot {
    std::size_t id;
    OnNext on_next;
    OnErr  on_err;
    OnDone on_done;
  };

  mutable std::mutex m_;
  std::vector<slot> slots_;
  std::size_t next_id_{0};
  bool completed_{false};
  std::optional<std::exception_ptr> error_;
};

} // namespace confluence
