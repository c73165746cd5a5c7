#include <confluence/confluence.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

using namespace confluence;
using namespace std::chrono_literals;

struct Trade { std::string symbol; double qty; };

int main() {
  manual_clock clk;
  subject<Trade>  trades;
  subject<double> fx_rate;

  // Every trade is priced with the latest known rate; rate updates alone emit nothing.
  auto priced = combine_latest_on_left(trades.as_observable(), fx_rate.as_observable(),
    [](const Trade& t, const double& rate){ return t.symbol + " " + std::to_string(t.qty * rate); },
    clk);

  auto sub = priced.subscribe([&](const std::string& s){
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(clk.now().time_since_epoch()).count();
    std::cout << "[t=" << std::setw(3) << ms << "ms] " << s << "\n";
  });

  trades.on_next({"EARLY", 1.0});   // no rate yet: dropped
  clk.advance(10ms); fx_rate.on_next(1.10);
  clk.advance(10ms); trades.on_next({"AAA", 100.0});
  clk.advance(10ms); trades.on_next({"BBB", 50.0});
  clk.advance(10ms); fx_rate.on_next(1.20);            // newer than the last trade: dropped
  clk.advance(10ms); trades.on_next({"CCC", 10.0});

  trades.on_completed();
  fx_rate.on_completed();
  return 0;
}
