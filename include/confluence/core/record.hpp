#pragma once
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace confluence {

class record;
using record_ptr = std::shared_ptr<const record>;

// One value stored in a record.
using field = std::variant<std::monostate, bool, std::int64_t, double, std::string, record_ptr>;

// Schema-less mapping from field name to field. Values are copied on write;
// nested records are shared read-only.
class record {
public:
  record() = default;
  record(std::initializer_list<std::pair<const std::string, field>> init) : fields_(init) {}

  bool has(std::string_view name) const { return find(name) != nullptr; }

  // nullptr when the key is absent
  const field* find(std::string_view name) const {
    auto it = fields_.find(name);
    return it == fields_.end() ? nullptr : &it->second;
  }

  record& set(std::string name, field value) {
    fields_.insert_or_assign(std::move(name), std::move(value));
    return *this;
  }

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }

  auto begin() const noexcept { return fields_.begin(); }
  auto end() const noexcept { return fields_.end(); }

private:
  std::map<std::string, field, std::less<>> fields_;
};

// Lift a plain value into a field.
template <class T>
field make_field(T&& v) {
  using U = std::decay_t<T>;
  if constexpr (std::is_same_v<U, field>) {
    return std::forward<T>(v);
  } else if constexpr (std::is_same_v<U, bool>) {
    return field{std::in_place_type<bool>, v};
  } else if constexpr (std::is_integral_v<U>) {
    return field{std::in_place_type<std::int64_t>, static_cast<std::int64_t>(v)};
  } else if constexpr (std::is_floating_point_v<U>) {
    return field{std::in_place_type<double>, static_cast<double>(v)};
  } else if constexpr (std::is_same_v<U, record>) {
    return field{std::in_place_type<record_ptr>, std::make_shared<const record>(std::forward<T>(v))};
  } else if constexpr (std::is_same_v<U, record_ptr>) {
    return field{std::in_place_type<record_ptr>, std::forward<T>(v)};
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    return field{std::in_place_type<std::string>, std::string(std::forward<T>(v))};
  } else {
    static_assert(std::is_same_v<U, field>, "confluence::make_field: unsupported value type");
  }
}

// Typed read; nullptr when the field is absent or holds another type.
template <class V>
const V* field_as(const record& r, std::string_view name) {
  const field* f = r.find(name);
  return f ? std::get_if<V>(f) : nullptr;
}

} // namespace confluence
