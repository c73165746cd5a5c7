#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/record.hpp>
#include <confluence/ops/map.hpp>
#include <string>
#include <utility>

namespace confluence {

// wrap_as(name): v -> record{ name: v }
struct op_wrap_as {
  std::string name;
  template <class T>
  observable<record> operator()(const observable<T>& src) const {
    return src | map([name = name](const T& v){
      record r;
      r.set(name, make_field(v));
      return r;
    });
  }
};

inline auto wrap_as(std::string name) { return op_wrap_as{ std::move(name) }; }

} // namespace confluence
