#pragma once
#include <cstddef>
#include <functional>
#include <unordered_map>
#include "types.hpp"
#include "position_id.hpp"

namespace tpe {

struct RedeemQuote {
  Status   status{Status::Ok};
  Quantity amount_out{0};
};

// Fungible claim shares per position plus the output each position has
// realized. Shares are minted and burned only here, so
//   sum(balance_of(p, *)) == supply(p)
// holds after every call.
class ClaimLedger {
public:
  // true if `shares` > 0 can be minted without overflowing supply or balance
  bool can_deposit(const PositionId& p, AccountId owner, Quantity shares) const;

  // mint `shares` of p to owner; InvalidOrder unless can_deposit()
  Status deposit(const PositionId& p, AccountId owner, Quantity shares);

  // burn `shares` of p from owner; InsufficientShare if owner holds less
  Status withdraw(const PositionId& p, AccountId owner, Quantity shares);

  // proceeds of an execution; InvalidOrder if claimable would overflow
  Status credit(const PositionId& p, Quantity amount_out);

  // What redeem() would pay, without mutating anything.
  RedeemQuote quote_redeem(const PositionId& p, AccountId owner, Quantity shares) const;

  // Burn `shares` and release floor(shares * claimable / supply).
  RedeemQuote redeem(const PositionId& p, AccountId owner, Quantity shares);

  Quantity balance_of(const PositionId& p, AccountId owner) const;
  Quantity supply(const PositionId& p) const;
  Quantity claimable(const PositionId& p) const;

  // Undo journal support: restore a position's claimable output exactly.
  void set_claimable(const PositionId& p, Quantity amount);

  void for_each_balance(const std::function<void(const PositionId&, AccountId, Quantity)>& fn) const;
  void for_each_position(const std::function<void(const PositionId&, Quantity supply,
                                                  Quantity claimable)>& fn) const;

private:
  struct BalanceKey {
    PositionId pos;
    AccountId  owner;
    bool operator==(const BalanceKey& o) const { return owner == o.owner && pos == o.pos; }
  };
  struct BalanceKeyHash {
    std::size_t operator()(const BalanceKey& k) const noexcept {
      return PositionIdHash{}(k.pos) ^ (k.owner * 0x9E3779B97F4A7C15ull);
    }
  };
  struct PositionTotals {
    Quantity supply{0};
    Quantity claimable{0};
  };

  std::unordered_map<BalanceKey, Quantity, BalanceKeyHash> balances_;
  std::unordered_map<PositionId, PositionTotals, PositionIdHash> positions_;
};

} // namespace tpe
