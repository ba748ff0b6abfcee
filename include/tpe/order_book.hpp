#pragma once
#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>
#include "types.hpp"

namespace tpe {

// Composite key of a pending position
struct OrderKey {
  MarketId  market;
  Tick      tick;      // spacing-aligned level
  Direction dir;

  bool operator==(const OrderKey& o) const {
    return market == o.market && tick == o.tick && dir == o.dir;
  }
};

struct OrderKeyHash {
  std::size_t operator()(const OrderKey& k) const noexcept {
    uint64_t h = k.market * 0x9E3779B97F4A7C15ull;
    h ^= static_cast<uint64_t>(k.tick) + 0x9E3779B97F4A7C15ull + (h << 6) + (h >> 2);
    h ^= static_cast<uint64_t>(k.dir) + (h << 6) + (h >> 2);
    return static_cast<std::size_t>(h);
  }
};

// Aggregate pending input per (market, level, direction), one flat map.
// Depositor shares live in the ClaimLedger; this only holds the totals the
// engine executes.
class OrderBook {
public:
  // qty > 0; returns InvalidOrder if the aggregate would overflow
  Status add(const OrderKey& k, Quantity qty);

  // returns InvalidOrder if the aggregate would go negative
  Status remove(const OrderKey& k, Quantity qty);

  Quantity pending(const OrderKey& k) const {
    auto it = pending_.find(k);
    return (it == pending_.end()) ? 0 : it->second;
  }

  bool has_level(const OrderKey& k) const { return pending(k) > 0; }

  // Overwrite an entry (undo journal / snapshot restore). 0 erases.
  void set_pending(const OrderKey& k, Quantity qty);

  std::size_t level_count() const { return pending_.size(); }

  // Enumerate only non-empty levels (zero entries are never stored).
  void for_each_nonempty(const std::function<void(const OrderKey&, Quantity)>& fn) const {
    for (const auto& kv : pending_) fn(kv.first, kv.second);
  }

  // (tick, pending) pairs of one market/direction, nearest-to-fill first:
  // ascending for ZeroForOne (fills on the way up), descending otherwise.
  std::vector<std::pair<Tick, Quantity>> levels(MarketId market, Direction dir,
                                                int max_levels) const;

private:
  std::unordered_map<OrderKey, Quantity, OrderKeyHash> pending_;
};

} // namespace tpe
