#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/record.hpp>
#include <confluence/ops/map.hpp>
#include <functional>
#include <string>
#include <utility>

namespace confluence {

// convert_property(from, to, fn): to = fn(from) when `from` is present and fn
// is set; otherwise the record passes unchanged. `to` may equal `from`.
struct op_convert_property {
  std::string from;
  std::string to;
  std::function<field(const field&)> fn;

  observable<record> operator()(const observable<record>& src) const {
    return src | map([from = from, to = to, fn = fn](const record& r){
      const field* f = r.find(from);
      if (!f || !fn) return r;
      record out = r;
      out.set(to, fn(*f));
      return out;
    });
  }
};

inline auto convert_property(std::string from, std::string to, std::function<field(const field&)> fn) {
  return op_convert_property{ std::move(from), std::move(to), std::move(fn) };
}

} // namespace confluence
