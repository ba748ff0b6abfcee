#include "tpe/order_book.hpp"
#include <algorithm>
#include <limits>

namespace tpe {

Status OrderBook::add(const OrderKey& k, Quantity qty) {
  if (qty <= 0) return Status::InvalidOrder;
  Quantity& slot = pending_[k];
  if (slot > std::numeric_limits<Quantity>::max() - qty) {
    if (slot == 0) pending_.erase(k);
    return Status::InvalidOrder;
  }
  slot += qty;
  return Status::Ok;
}

Status OrderBook::remove(const OrderKey& k, Quantity qty) {
  if (qty <= 0) return Status::InvalidOrder;
  auto it = pending_.find(k);
  const Quantity have = (it == pending_.end()) ? 0 : it->second;
  if (have < qty) return Status::InvalidOrder;
  if (have == qty) pending_.erase(it);
  else             it->second = have - qty;
  return Status::Ok;
}

void OrderBook::set_pending(const OrderKey& k, Quantity qty) {
  if (qty <= 0) { pending_.erase(k); return; }
  pending_[k] = qty;
}

std::vector<std::pair<Tick, Quantity>> OrderBook::levels(MarketId market, Direction dir,
                                                          int max_levels) const {
  std::vector<std::pair<Tick, Quantity>> out;
  if (max_levels <= 0) return out;

  for (const auto& kv : pending_) {
    if (kv.first.market == market && kv.first.dir == dir) {
      out.emplace_back(kv.first.tick, kv.second);
    }
  }

  if (dir == Direction::ZeroForOne) {
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b){ return a.first < b.first; });
  } else {
    std::sort(out.begin(), out.end(),
              [](const auto& a, const auto& b){ return a.first > b.first; });
  }

  if (static_cast<int>(out.size()) > max_levels) out.resize(static_cast<size_t>(max_levels));
  return out;
}

} // namespace tpe
