#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "tpe/types.hpp"
#include "tpe/engine.hpp"
#include "tpe/sim_market.hpp"
#include "tpe/fill_writer.hpp"

namespace tpe {

// Command types accepted from a replay CSV.
enum class CmdType : uint8_t { Init=0, Fund=1, Place=2, Cancel=3, Redeem=4, Swap=5 };

struct Command {
  SeqNo     seq;
  CmdType   type;
  AccountId account;
  MarketId  market;
  Tick      tick;     // target/level; initial tick for init; gas sample for swap (0 = none)
  Direction dir;      // order direction; asset selector for fund (0=asset0, 1=asset1)
  Quantity  amount;   // input, shares, swap size; depth per tick for init
  Tick      spacing;  // init only
};

const char* to_string(CmdType t);

// Simple, dependency-free CSV reader for replay commands:
// Expected header and columns (in this order):
// seq,op,account,market,tick,dir,amount,spacing
// - op:  init | fund | place | cancel | redeem | swap (case-insensitive)
// - dir: 0 | 1 (empty allowed -> 0)
// - spacing may be empty except on init rows
bool load_command_csv(const std::string& path, std::vector<Command>& out);

// Assets of a replayed market: asset0 = 2*id, asset1 = 2*id + 1.
inline MarketConfig replay_market_config(MarketId id, Tick spacing) {
  return MarketConfig{id, 2 * id, 2 * id + 1, spacing};
}

// Replayer: feeds commands into the engine and the simulated market in
// order, writing one result row per command and one row per fill.
class Replayer {
public:
  struct Options {
    bool stop_on_error = false;  // abort on the first non-ok command
    bool award_points  = false;  // swaps name the trader as points recipient
  };

  struct Totals {
    std::size_t ok{0};
    std::size_t rejected{0};
    std::size_t fills{0};
  };

  Replayer(Engine& engine, SimMarket& market, BalanceSheet& balances, FillWriter* writer);

  // Returns false if stop_on_error tripped or no commands were given.
  bool run(const std::vector<Command>& cmds, const Options& opt);

  const Totals& totals() const { return totals_; }

private:
  Status apply(const Command& c, const Options& opt, int64_t& value);

  Engine&       engine_;
  SimMarket&    market_;
  BalanceSheet& balances_;
  FillWriter*   writer_{nullptr};
  Totals        totals_;
};

} // namespace tpe
