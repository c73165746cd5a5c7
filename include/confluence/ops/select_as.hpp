#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/ops/map.hpp>
#include <utility>

namespace confluence {

// select_as(v): every element is replaced by v.
template <class V>
struct op_select_as {
  V value;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return src | map([value = value](const T&){ return value; });
  }
};

template <class V>
inline auto select_as(V v) { return op_select_as<V>{ std::move(v) }; }

} // namespace confluence
