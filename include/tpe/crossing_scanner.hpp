#pragma once
#include <optional>
#include "types.hpp"
#include "order_book.hpp"

namespace tpe {

struct Crossing {
  Tick      tick;       // level holding the matched aggregate
  Direction dir;
  Quantity  amount;     // whole aggregate pending at the level
};

// Finds the nearest non-empty level a price move from `previous` to
// `current` walked over.
//  - up:   ZeroForOne levels L0, L0+s, ... < current, L0 = first level >= previous
//  - down: OneForZero levels L0, L0-s, ... > current, L0 = resolve_level(previous)
// Only the first hit is reported; callers rescan after acting on it.
class CrossingScanner {
public:
  explicit CrossingScanner(const OrderBook& book) : book_(book) {}

  std::optional<Crossing> find(MarketId market, Tick spacing,
                               Tick previous, Tick current) const;

private:
  const OrderBook& book_;
};

} // namespace tpe
