#include <benchmark/benchmark.h>
#include <confluence/confluence.hpp>
#include <string>
#include <vector>

using namespace confluence;

static observable<int> just_range(int count) {
  return observable<int>::create([count](auto on_next, auto, auto on_done){
    for (int i = 0; i < count; ++i) if (on_next) on_next(i);
    if (on_done) on_done();
    return subscription{};
  });
}

static void BM_fork_join_sources(benchmark::State& state) {
  std::vector<observable<int>> sources;
  for (int i = 0; i < state.range(0); ++i) sources.push_back(just_range(4));
  auto joined = fork_join(std::move(sources));
  volatile std::size_t sink = 0;

  for (auto _ : state) {
    auto sub = joined.subscribe([&](const std::vector<int>& v){
      sink = v.size();
      benchmark::DoNotOptimize(sink);
    });
  }
}
BENCHMARK(BM_fork_join_sources)->Arg(2)->Arg(16)->Arg(128);

static void BM_fork_join_long_sources(benchmark::State& state) {
  auto joined = fork_join(std::vector<observable<int>>{ just_range(static_cast<int>(state.range(0))),
                                                        just_range(static_cast<int>(state.range(0))) });
  volatile int sink = 0;

  for (auto _ : state) {
    auto sub = joined.subscribe([&](const std::vector<int>& v){
      sink = v.back();
      benchmark::DoNotOptimize(sink);
    });
  }
}
BENCHMARK(BM_fork_join_long_sources)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_combine_latest_on_left(benchmark::State& state) {
  manual_clock clk;
  subject<int> left, right;
  volatile int sink = 0;

  auto sub = combine_latest_on_left(left.as_observable(), right.as_observable(),
                                    [](int l, int r){ return l + r; }, clk)
    .subscribe([&](int v){
      sink = v;
      benchmark::DoNotOptimize(sink);
    });
  right.on_next(1);

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) {
      clk.advance(std::chrono::microseconds(1));
      left.on_next(i);
    }
  }
}
BENCHMARK(BM_combine_latest_on_left)->Arg(100)->Arg(1000)->Arg(10000);

static void BM_record_projection(benchmark::State& state) {
  subject<int> numbers;
  volatile std::size_t sink = 0;

  auto sub = (numbers.as_observable()
      | wrap_as("n")
      | convert_property("n", "even", [](const field& f){ return make_field(std::get<std::int64_t>(f) % 2 == 0); })
      | where_true("even"))
    .subscribe([&](const record& r){
      sink = r.size();
      benchmark::DoNotOptimize(sink);
    });

  for (auto _ : state) {
    for (int i = 0; i < state.range(0); ++i) numbers.on_next(i);
  }
}
BENCHMARK(BM_record_projection)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
