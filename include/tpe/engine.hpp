#pragma once
#include <optional>
#include <vector>
#include "types.hpp"
#include "tick_math.hpp"
#include "position_id.hpp"
#include "order_book.hpp"
#include "claim_ledger.hpp"
#include "crossing_scanner.hpp"
#include "market.hpp"
#include "state.hpp"
#include "logging.hpp"

namespace tpe {

struct EngineOptions {
  AccountId self_id = 0x7E;          // custody account; initiator of engine trades
  int       max_fills_per_cycle = 64; // 0 = unbounded
};

struct PlaceResult {
  Status status{Status::Ok};
  Tick   tick{0};          // resolved, spacing-aligned level
};

struct RedeemResult {
  Status   status{Status::Ok};
  Quantity amount_out{0};
};

struct Fill {
  OrderKey key;
  Quantity amount_in;
  Quantity amount_out;
  Tick     new_tick;
};

// Summary of one trade-triggered scan/execute cycle
struct CycleResult {
  Status            status{Status::Ok};
  std::vector<Fill> fills;
  bool              deferred{false}; // fill bound hit; remainder left for the next trigger
  Tick              last_tick{0};
};

// Take-profit execution engine.
//
// Depositors place input at a price level; when a trade on the market walks
// the price over that level, the whole aggregate is sold in one trade and the
// proceeds become redeemable pro rata to claim shares.
class Engine final : public ITradeListener {
public:
  Engine(EngineState& state, IMarket& market, IAssetTransfer& transfers,
         IEventLogger* logger = nullptr, EngineOptions opt = {})
    : state_(state), market_(market), transfers_(transfers),
      logger_(logger), opt_(opt) {
    if (logger_) logger_->set_snapshot_source(&state_);
  }

  // Start tracking a market; LastObservedPrice is the market's current tick.
  Status initialize_market(const MarketConfig& cfg);

  // -------- client surface --------
  PlaceResult  place_order (AccountId caller, MarketId market, Tick target_tick,
                            Direction dir, Quantity amount);
  Status       cancel_order(AccountId caller, MarketId market, Tick level,
                            Direction dir, Quantity amount);
  RedeemResult redeem      (AccountId caller, MarketId market, Tick level,
                            Direction dir, Quantity shares);

  // Level is resolved with the market's spacing when the market is tracked.
  PositionId position_id(MarketId market, Tick level, Direction dir) const;

  // -------- trigger --------
  Status on_trade(const TradeNotice& notice) override;

  // Scan/execute until no crossing remains (or the fill bound is hit).
  CycleResult run_cycle(MarketId market);

  const CycleResult& last_cycle() const { return last_cycle_; }

  // -------- queries --------
  const EngineState& state() const { return state_; }
  std::optional<Tick> last_tick(MarketId market) const;
  Quantity pending(MarketId market, Tick level, Direction dir) const;
  Quantity share_of(AccountId owner, MarketId market, Tick level, Direction dir) const;
  Quantity claimable(MarketId market, Tick level, Direction dir) const;
  const EngineOptions& options() const { return opt_; }

private:
  // Pre-mutation values of every entry a cycle touches
  struct UndoEntry {
    OrderKey   key;
    Quantity   pending_before;
    PositionId pos;
    Quantity   claimable_before;
  };

  TrackedMarket* find_market(MarketId id) {
    auto it = state_.markets.find(id);
    return (it == state_.markets.end()) ? nullptr : &it->second;
  }
  const TrackedMarket* find_market(MarketId id) const { return state_.market(id); }

  void rollback(const std::vector<UndoEntry>& undo);

  // Execute crossings between m.last_tick and `end` until none remain or the
  // fill bound is hit. With follow_market, `end` moves to each trade's tick.
  Status sweep(TrackedMarket& m, Tick& end, bool follow_market,
               CycleResult& r, std::vector<UndoEntry>& undo);

private:
  EngineState&    state_;
  IMarket&        market_;
  IAssetTransfer& transfers_;
  IEventLogger*   logger_{nullptr};
  EngineOptions   opt_;
  CycleResult     last_cycle_;
};

} // namespace tpe
