#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/record.hpp>
#include <confluence/ops/map.hpp>
#include <string>
#include <utility>

namespace confluence {

// select_property(name): the named field, or the whole record (as a nested
// record field) when there is no such key.
struct op_select_property {
  std::string name;

  observable<field> operator()(const observable<record>& src) const {
    return src | map([name = name](const record& r){
      if (const field* f = r.find(name)) return *f;
      return make_field(r);
    });
  }
};

inline auto select_property(std::string name) { return op_select_property{ std::move(name) }; }

} // namespace confluence
