#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <confluence/confluence.hpp>

using namespace confluence;

int main() {
  // 1) map + filter
  {
    subject<int> numbers;
    std::vector<int> got;
    auto sub = (numbers.as_observable()
      | map([](const int& x){ return x * 2; })
      | filter([](int x){ return x % 4 == 0; })
    ).subscribe([&](int v){ got.push_back(v); });

    for (int i = 1; i <= 5; ++i) numbers.on_next(i);
    assert((got == std::vector<int>{4, 8}) && "Should only receive doubled even numbers");
  }

  // 2) A throwing projection becomes on_error and unsubscribes upstream
  {
    subject<int> numbers;
    std::vector<int> got;
    bool failed = false;
    auto sub = (numbers.as_observable()
      | map([](int x){ if (x == 3) throw std::domain_error("three"); return x; })
    ).subscribe([&](int v){ got.push_back(v); }, [&](std::exception_ptr){ failed = true; });

    numbers.on_next(1);
    numbers.on_next(3);
    numbers.on_next(4);
    assert((got == std::vector<int>{1}));
    assert(failed);
    assert(numbers.observer_count() == 0);
  }

  // 3) A throwing predicate as well
  {
    subject<std::string> words;
    bool failed = false;
    auto sub = (words.as_observable()
      | filter([](const std::string& w){ return w.at(3) == 'x'; })
    ).subscribe([](const std::string&){}, [&](std::exception_ptr){ failed = true; });

    words.on_next("ab");
    assert(failed && words.observer_count() == 0);
  }

  // 4) aggregate: seeded fold emitted on completion
  {
    subject<int> numbers;
    std::vector<int> got;
    bool done = false;
    auto sub = (numbers.as_observable()
      | aggregate(100, [](int acc, int v){ return acc + v; })
    ).subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });

    numbers.on_next(1);
    numbers.on_next(2);
    assert(got.empty());
    numbers.on_completed();
    assert((got == std::vector<int>{103}) && done);
  }

  // 5) aggregate over an empty source yields the seed; errors drop the state
  {
    subject<int> empty;
    int got = 0;
    auto sub = (empty.as_observable() | aggregate(7, [](int a, int b){ return a + b; }))
      .subscribe([&](int v){ got = v; });
    empty.on_completed();
    assert(got == 7);

    subject<int> failing;
    int values = 0;
    bool failed = false;
    auto sub2 = (failing.as_observable() | aggregate(0, [](int a, int b){ return a + b; }))
      .subscribe([&](int){ ++values; }, [&](std::exception_ptr){ failed = true; });
    failing.on_next(1);
    failing.on_error(std::make_exception_ptr(std::runtime_error("x")));
    assert(failed && values == 0);
  }

  // 6) last(): the final value, or nothing for an empty source
  {
    subject<int> numbers;
    std::vector<int> got;
    bool done = false;
    auto sub = (numbers.as_observable() | last())
      .subscribe([&](int v){ got.push_back(v); }, nullptr, [&]{ done = true; });
    numbers.on_next(1);
    numbers.on_next(2);
    assert(got.empty());
    numbers.on_completed();
    assert((got == std::vector<int>{2}) && done);

    subject<int> empty;
    int values = 0;
    bool empty_done = false;
    auto sub2 = (empty.as_observable() | last())
      .subscribe([&](int){ ++values; }, nullptr, [&]{ empty_done = true; });
    empty.on_completed();
    assert(values == 0 && empty_done);
  }

  // 7) timestamp() reads the clock at arrival
  {
    manual_clock clk(instant(std::chrono::seconds(10)));
    subject<char> letters;
    std::vector<timestamped<char>> got;
    auto sub = (letters.as_observable() | timestamp(clk))
      .subscribe([&](const timestamped<char>& t){ got.push_back(t); });

    letters.on_next('a');
    clk.advance(std::chrono::milliseconds(250));
    letters.on_next('b');

    assert(got.size() == 2);
    assert(got[0].value == 'a' && got[0].timestamp == instant(std::chrono::seconds(10)));
    assert(got[1].value == 'b' && got[1].timestamp == instant(std::chrono::milliseconds(10250)));
  }

  std::cout << "[observable_ops_tests] OK\n";
  return 0;
}
