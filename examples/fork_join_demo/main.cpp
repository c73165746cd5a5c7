#include <confluence/confluence.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace confluence;
using namespace std::chrono_literals;

// A "request" that answers on the shared timeline after a few ticks.
static observable<std::string> fake_request(std::string name, int ticks, strand& loop) {
  return observable<std::string>::create([name = std::move(name), ticks, &loop](auto on_next, auto, auto on_done){
    auto alive = std::make_shared<bool>(true);
    for (int i = 0; i < ticks; ++i) {
      loop.post([alive, on_next, name, i]{
        if (*alive && on_next) on_next(name + " (partial " + std::to_string(i) + ")");
      });
    }
    loop.post([alive, on_next, on_done, name]{
      if (!*alive) return;
      if (on_next) on_next(name + " (final)");
      if (on_done) on_done();
    });
    return subscription([alive]{ *alive = false; });
  });
}

int main() {
  logging::load_env_levels();
  std::cout << "confluence " << version::string << "\n";
  strand loop;

  // === DEMO: fork_join over three requests ====================================
  {
    auto all = fork_join(std::vector<observable<std::string>>{
      fake_request("profile", 2, loop),
      fake_request("orders", 0, loop),
      fake_request("settings", 1, loop),
    });

    auto sub = all.subscribe(
      [](const std::vector<std::string>& parts){
        std::cout << "[FORK_JOIN] got " << parts.size() << " results\n";
        for (const auto& p : parts) std::cout << "  " << p << "\n";
      },
      nullptr,
      []{ std::cout << "[FORK_JOIN] done\n"; }
    );
    loop.drain();
  }

  // === DEMO: a source that completes empty, guarded by timeout ================
  {
    auto never = observable<std::string>::create([](auto, auto, auto on_done){
      if (on_done) on_done();
      return subscription{};
    });

    auto sub = (fork_join(std::vector<observable<std::string>>{ fake_request("profile", 0, loop), never })
                | timeout(100ms, loop))
      .subscribe(
        [](const std::vector<std::string>&){ std::cout << "[GUARDED] unexpected value\n"; },
        [](std::exception_ptr e){
          try { std::rethrow_exception(e); }
          catch (const std::exception& ex) { std::cout << "[GUARDED] error: " << ex.what() << "\n"; }
        }
      );

    loop.drain();
    std::this_thread::sleep_for(150ms);
    loop.drain();
  }

  return 0;
}
