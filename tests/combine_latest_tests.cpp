#include <cassert>
#include <iostream>
#include <stdexcept>
#include <vector>
#include <confluence/confluence.hpp>

using namespace confluence;

int main() {
  // 1) Nothing before the first pair, then every event emits
  {
    subject<int> ta, tb;
    std::vector<int> got;
    auto sub = combine_latest(ta.as_observable(), tb.as_observable(), [](int x, int y){ return x + y; })
      .subscribe([&](int v){ got.push_back(v); });

    ta.on_next(1);   // b has no value yet
    tb.on_next(10);  // 1+10
    ta.on_next(2);   // 2+10
    tb.on_next(20);  // 2+20
    assert((got == std::vector<int>{11, 12, 22}) && "combine_latest should combine with the latest known values");
  }

  // 2) Completion only when both sides completed
  {
    subject<int> ta, tb;
    bool done = false;
    auto sub = combine_latest(ta.as_observable(), tb.as_observable(), [](int x, int y){ return x * y; })
      .subscribe([](int){}, nullptr, [&]{ done = true; });
    ta.on_completed();
    assert(!done);
    tb.on_completed();
    assert(done);
  }

  // 3) The combined stream outlives the temporary observable it came from
  {
    subject<int> ta, tb;
    std::vector<int> got;
    subscription sub;
    {
      auto multiplier = 3;
      sub = combine_latest(ta.as_observable(), tb.as_observable(),
                           [multiplier](int x, int y){ return (x + y) * multiplier; })
        .subscribe([&](int v){ got.push_back(v); });
    }
    ta.on_next(1);
    tb.on_next(1);
    assert((got == std::vector<int>{6}));
  }

  // 4) An error terminates once and unsubscribes the other side
  {
    subject<int> ta, tb;
    int errors = 0;
    auto sub = combine_latest(ta.as_observable(), tb.as_observable(), [](int x, int y){ return x - y; })
      .subscribe([](int){}, [&](std::exception_ptr){ ++errors; });
    ta.on_error(std::make_exception_ptr(std::runtime_error("a")));
    assert(errors == 1);
    assert(tb.observer_count() == 0);
  }

  std::cout << "[combine_latest_tests] OK\n";
  return 0;
}
