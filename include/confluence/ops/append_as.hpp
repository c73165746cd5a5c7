#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/record.hpp>
#include <confluence/ops/map.hpp>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace confluence {

// Either a literal field or a function computing it from the current element.
template <class In>
class field_source {
public:
  using supplier = std::function<field(const In&)>;

  static field_source literal(field value) { return field_source(std::move(value)); }
  static field_source deferred(supplier fn) { return field_source(std::move(fn)); }

  field resolve(const In& current) const {
    if (auto fn = std::get_if<supplier>(&choice_)) return (*fn)(current);
    return std::get<field>(choice_);
  }

private:
  explicit field_source(field value) : choice_(std::move(value)) {}
  explicit field_source(supplier fn) : choice_(std::move(fn)) {}

  std::variant<field, supplier> choice_;
};

// append_as(name, source): a record gets the field added (or replaced); any
// other element becomes a fresh record holding only that field. The source is
// resolved once per element.
template <class In>
struct op_append_as {
  std::string name;
  field_source<In> source;

  observable<record> operator()(const observable<In>& src) const {
    return src | map([name = name, source = source](const In& v){
      if constexpr (std::is_same_v<In, record>) {
        record out = v;
        out.set(name, source.resolve(v));
        return out;
      } else {
        record out;
        out.set(name, source.resolve(v));
        return out;
      }
    });
  }
};

template <class In>
inline auto append_as(std::string name, field_source<In> source) {
  return op_append_as<In>{ std::move(name), std::move(source) };
}

} // namespace confluence
