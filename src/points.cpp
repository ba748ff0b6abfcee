#include "tpe/points.hpp"
#include <algorithm>
#include <limits>

namespace tpe {

Quantity PointsLedger::issue(std::optional<AccountId> recipient, Quantity spent) {
  if (!recipient || spent <= 0 || den_ <= 0) return 0;
  const Quantity pts = static_cast<Quantity>(
      static_cast<__int128>(spent) * num_ / den_);
  if (pts <= 0) return 0;
  constexpr Quantity kMax = std::numeric_limits<Quantity>::max();
  if (total_ > kMax - pts || balance_of(*recipient) > kMax - pts) return 0;
  balances_[*recipient] += pts;
  total_ += pts;
  return pts;
}

void PointsLedger::revoke(AccountId who, Quantity points) {
  auto it = balances_.find(who);
  if (it == balances_.end() || points <= 0) return;
  const Quantity taken = std::min(points, it->second);
  it->second -= taken;
  total_ -= taken;
  if (it->second == 0) balances_.erase(it);
}

} // namespace tpe
