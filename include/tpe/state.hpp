#pragma once
#include <optional>
#include <unordered_map>
#include "types.hpp"
#include "order_book.hpp"
#include "claim_ledger.hpp"

namespace tpe {

struct TrackedMarket {
  MarketConfig cfg;
  Tick         last_tick;   // raw tick as of the last completed scan
  // end of a sweep the fill bound cut short; scanned before any new move
  std::optional<Tick> deferred_to{};
};

// Everything the engine persists. Owned by the caller so that it can be
// snapshotted, restored, and handed to a fresh engine.
struct EngineState {
  std::unordered_map<MarketId, TrackedMarket> markets;
  OrderBook   book;
  ClaimLedger ledger;

  const TrackedMarket* market(MarketId id) const {
    auto it = markets.find(id);
    return (it == markets.end()) ? nullptr : &it->second;
  }
};

} // namespace tpe
