#pragma once
#include <confluence/core/observable.hpp>
#include <confluence/core/record.hpp>
#include <confluence/ops/filter.hpp>
#include <string>
#include <utility>

namespace confluence {

// where_true() / where_false() on observable<bool>
struct op_where_value {
  bool wanted;
  observable<bool> operator()(const observable<bool>& src) const {
    return src | filter([wanted = wanted](bool v){ return v == wanted; });
  }
};

// where_true(name) / where_false(name) on observable<record>: the field must
// exist and hold exactly that boolean.
struct op_where_field {
  bool wanted;
  std::string name;
  observable<record> operator()(const observable<record>& src) const {
    return src | filter([wanted = wanted, name = name](const record& r){
      const bool* flag = field_as<bool>(r, name);
      return flag && *flag == wanted;
    });
  }
};

inline auto where_true()  { return op_where_value{true}; }
inline auto where_false() { return op_where_value{false}; }
inline auto where_true(std::string name)  { return op_where_field{true, std::move(name)}; }
inline auto where_false(std::string name) { return op_where_field{false, std::move(name)}; }

} // namespace confluence
