#pragma once
#include <optional>
#include <unordered_map>
#include "types.hpp"

namespace tpe {

// Loyalty points: a fixed fraction of the amount spent, minted to whoever
// the triggering call names.
class PointsLedger {
public:
  PointsLedger(Quantity num = 1, Quantity den = 5) : num_(num), den_(den) {}

  // Returns the points minted (0 without a recipient, or if the
  // recipient's balance or the total would overflow).
  Quantity issue(std::optional<AccountId> recipient, Quantity spent);

  // Take back points from a reverted trade (at most the holder's balance).
  void revoke(AccountId who, Quantity points);

  Quantity balance_of(AccountId who) const {
    auto it = balances_.find(who);
    return (it == balances_.end()) ? 0 : it->second;
  }
  Quantity total_issued() const { return total_; }

private:
  Quantity num_;
  Quantity den_;
  Quantity total_{0};
  std::unordered_map<AccountId, Quantity> balances_;
};

} // namespace tpe
