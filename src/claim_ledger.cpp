#include "tpe/claim_ledger.hpp"
#include <limits>

namespace tpe {

namespace {

// floor(a * b / d) without intermediate overflow; a, b >= 0, d > 0
inline Quantity mul_div_down(Quantity a, Quantity b, Quantity d) {
  const unsigned __int128 num = static_cast<unsigned __int128>(a) * static_cast<unsigned __int128>(b);
  return static_cast<Quantity>(num / static_cast<unsigned __int128>(d));
}

} // namespace

bool ClaimLedger::can_deposit(const PositionId& p, AccountId owner, Quantity shares) const {
  if (shares <= 0) return false;
  constexpr Quantity kMax = std::numeric_limits<Quantity>::max();
  // balance <= supply, but a restored or hand-built ledger need not hold that yet
  return supply(p) <= kMax - shares && balance_of(p, owner) <= kMax - shares;
}

Status ClaimLedger::deposit(const PositionId& p, AccountId owner, Quantity shares) {
  if (!can_deposit(p, owner, shares)) return Status::InvalidOrder;
  balances_[BalanceKey{p, owner}] += shares;
  positions_[p].supply += shares;
  return Status::Ok;
}

Status ClaimLedger::withdraw(const PositionId& p, AccountId owner, Quantity shares) {
  if (shares <= 0) return Status::InvalidOrder;
  auto it = balances_.find(BalanceKey{p, owner});
  if (it == balances_.end() || it->second < shares) return Status::InsufficientShare;

  it->second -= shares;
  if (it->second == 0) balances_.erase(it);
  positions_[p].supply -= shares;
  return Status::Ok;
}

Status ClaimLedger::credit(const PositionId& p, Quantity amount_out) {
  if (amount_out < 0) return Status::InvalidOrder;
  if (amount_out == 0) return Status::Ok;
  if (claimable(p) > std::numeric_limits<Quantity>::max() - amount_out) return Status::InvalidOrder;
  positions_[p].claimable += amount_out;
  return Status::Ok;
}

RedeemQuote ClaimLedger::quote_redeem(const PositionId& p, AccountId owner,
                                      Quantity shares) const {
  RedeemQuote q{};
  if (shares <= 0) { q.status = Status::InvalidOrder; return q; }

  auto pit = positions_.find(p);
  if (pit == positions_.end() || pit->second.claimable <= 0) {
    q.status = Status::NothingToClaim;
    return q;
  }
  if (balance_of(p, owner) < shares) {
    q.status = Status::InsufficientShare;
    return q;
  }

  // supply >= owner's balance >= shares > 0
  q.amount_out = mul_div_down(shares, pit->second.claimable, pit->second.supply);
  return q;
}

RedeemQuote ClaimLedger::redeem(const PositionId& p, AccountId owner, Quantity shares) {
  RedeemQuote q = quote_redeem(p, owner, shares);
  if (q.status != Status::Ok) return q;

  positions_[p].claimable -= q.amount_out;
  q.status = withdraw(p, owner, shares);  // checked by the quote; cannot fail
  return q;
}

Quantity ClaimLedger::balance_of(const PositionId& p, AccountId owner) const {
  auto it = balances_.find(BalanceKey{p, owner});
  return (it == balances_.end()) ? 0 : it->second;
}

Quantity ClaimLedger::supply(const PositionId& p) const {
  auto it = positions_.find(p);
  return (it == positions_.end()) ? 0 : it->second.supply;
}

Quantity ClaimLedger::claimable(const PositionId& p) const {
  auto it = positions_.find(p);
  return (it == positions_.end()) ? 0 : it->second.claimable;
}

void ClaimLedger::set_claimable(const PositionId& p, Quantity amount) {
  positions_[p].claimable = (amount < 0) ? 0 : amount;
}

void ClaimLedger::for_each_balance(
    const std::function<void(const PositionId&, AccountId, Quantity)>& fn) const {
  for (const auto& kv : balances_) fn(kv.first.pos, kv.first.owner, kv.second);
}

void ClaimLedger::for_each_position(
    const std::function<void(const PositionId&, Quantity, Quantity)>& fn) const {
  for (const auto& kv : positions_) fn(kv.first, kv.second.supply, kv.second.claimable);
}

} // namespace tpe
