#include <confluence/confluence.hpp>
#include <iostream>
#include <string>

using namespace confluence;

static void print(const record& r) {
  std::cout << "{";
  bool first = true;
  for (const auto& [name, value] : r) {
    std::cout << (first ? " " : ", ") << name << ": ";
    first = false;
    std::visit([](const auto& v){
      using V = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<V, std::monostate>) std::cout << "null";
      else if constexpr (std::is_same_v<V, bool>) std::cout << (v ? "true" : "false");
      else if constexpr (std::is_same_v<V, record_ptr>) std::cout << "{...}";
      else std::cout << v;
    }, value);
  }
  std::cout << " }\n";
}

int main() {
  subject<std::string> names;

  // "ann" -> { user: "ann" } -> + length -> + long_name flag -> only long names
  auto pipeline = names.as_observable()
    | wrap_as("user")
    | append_as("length", field_source<record>::deferred([](const record& r){
        return make_field(std::get<std::string>(*r.find("user")).size());
      }))
    | convert_property("length", "long_name", [](const field& f){
        return make_field(std::get<std::int64_t>(f) > 4);
      })
    | where_true("long_name");

  auto sub = pipeline.subscribe([](const record& r){ print(r); });

  names.on_next("ann");
  names.on_next("margaret");
  names.on_next("bob");
  names.on_next("christopher");

  auto users = (names.as_observable() | wrap_as("user") | select_property("user"))
    .subscribe([](const field& f){ std::cout << "[SELECT] " << std::get<std::string>(f) << "\n"; });
  names.on_next("zoe");
  names.on_completed();
  return 0;
}
