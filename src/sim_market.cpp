#include "tpe/sim_market.hpp"
#include "tpe/tick_math.hpp"
#include <cmath>
#include <limits>

namespace tpe {

// -----------------------------
// BalanceSheet
// -----------------------------
Status BalanceSheet::mint(AssetId asset, AccountId to, Quantity amount) {
  if (amount <= 0) return Status::InvalidOrder;
  const Key k{asset, to};
  const Quantity have = balance(asset, to);
  if (have > std::numeric_limits<Quantity>::max() - amount) return Status::InvalidOrder;
  set_balance(k, have + amount);
  return Status::Ok;
}

Quantity BalanceSheet::balance(AssetId asset, AccountId who) const {
  auto it = balances_.find(Key{asset, who});
  return (it == balances_.end()) ? 0 : it->second;
}

Status BalanceSheet::move(AssetId asset, AccountId from, AccountId to, Quantity amount) {
  if (amount < 0) return Status::TransferFailure;
  if (amount == 0 || from == to) {
    return balance(asset, from) >= amount ? Status::Ok : Status::TransferFailure;
  }
  const Quantity src = balance(asset, from);
  const Quantity dst = balance(asset, to);
  if (src < amount) return Status::TransferFailure;
  if (dst > std::numeric_limits<Quantity>::max() - amount) return Status::TransferFailure;
  set_balance(Key{asset, from}, src - amount);
  set_balance(Key{asset, to}, dst + amount);
  return Status::Ok;
}

void BalanceSheet::set_balance(const Key& k, Quantity v) {
  if (open_savepoints_ > 0) {
    auto it = balances_.find(k);
    journal_.push_back(JournalEntry{k, (it == balances_.end()) ? 0 : it->second});
  }
  if (v == 0) balances_.erase(k);
  else        balances_[k] = v;
}

std::size_t BalanceSheet::begin_savepoint() {
  ++open_savepoints_;
  return journal_.size();
}

void BalanceSheet::close_savepoint() {
  if (open_savepoints_ > 0 && --open_savepoints_ == 0) journal_.clear();
}

void BalanceSheet::release_savepoint(std::size_t /*sp*/) {
  // outer savepoints still need the entries
  close_savepoint();
}

void BalanceSheet::rollback_to(std::size_t sp) {
  while (journal_.size() > sp) {
    const JournalEntry& e = journal_.back();
    if (e.before == 0) balances_.erase(e.key);
    else               balances_[e.key] = e.before;
    journal_.pop_back();
  }
  close_savepoint();
}

// -----------------------------
// SimMarket
// -----------------------------
double SimMarket::price_at_tick(Tick t) {
  return std::pow(1.0001, static_cast<double>(t));
}

bool SimMarket::create_market(const MarketConfig& cfg, Tick initial_tick,
                              Quantity depth_per_tick) {
  if (depth_per_tick <= 0 || cfg.spacing <= 0 || !in_tick_range(initial_tick)) return false;
  return pools_.emplace(cfg.id, Pool{cfg, initial_tick, depth_per_tick}).second;
}

Tick SimMarket::current_tick(MarketId market) const {
  auto it = pools_.find(market);
  return (it == pools_.end()) ? 0 : it->second.tick;
}

const MarketConfig* SimMarket::config(MarketId market) const {
  auto it = pools_.find(market);
  return (it == pools_.end()) ? nullptr : &it->second.cfg;
}

TradeResult SimMarket::trade(AccountId initiator, MarketId market, Direction dir,
                             Quantity exact_in, const SwapContext& ctx) {
  TradeResult r{};
  auto it = pools_.find(market);
  if (it == pools_.end() || exact_in <= 0) { r.status = Status::MarketFailure; return r; }
  Pool& p = it->second;
  r.new_tick = p.tick;

  const uint32_t fee_pips = !fee_ ? 0u
                          : ctx.gas_price ? fee_->fee_for(*ctx.gas_price)
                          : fee_->base_fee();
  const Quantity fee = static_cast<Quantity>(
      static_cast<__int128>(exact_in) * fee_pips / FEE_DENOMINATOR);
  const Quantity net = exact_in - fee;

  const Tick move     = net / p.depth;
  const Tick new_tick = (dir == Direction::ZeroForOne) ? p.tick - move : p.tick + move;
  if (!in_tick_range(new_tick)) { r.status = Status::MarketFailure; return r; }

  const double mid   = price_at_tick((p.tick + new_tick) / 2);
  const double out_d = (dir == Direction::ZeroForOne) ? static_cast<double>(net) * mid
                                                      : static_cast<double>(net) / mid;
  if (!std::isfinite(out_d) || out_d >= static_cast<double>(std::numeric_limits<Quantity>::max())) {
    r.status = Status::MarketFailure;
    return r;
  }
  const Quantity out = static_cast<Quantity>(std::floor(out_d));

  const AssetId in_asset  = input_asset(p.cfg, dir);
  const AssetId out_asset = output_asset(p.cfg, dir);
  if (balances_.balance(out_asset, account_) < out) {
    r.status = Status::MarketFailure;    // reserves exhausted
    return r;
  }
  if (balances_.balance(in_asset, initiator) < exact_in) {
    r.status = Status::TransferFailure;
    return r;
  }

  // everything below may be undone by the listener
  const std::size_t sp = balances_.begin_savepoint();
  const Tick saved_tick = p.tick;
  std::optional<MovingAverageFee> saved_fee;
  if (fee_) saved_fee = *fee_;

  Status st = balances_.move(in_asset, initiator, account_, exact_in);
  if (st == Status::Ok) st = balances_.move(out_asset, account_, initiator, out);
  if (st != Status::Ok) {
    balances_.rollback_to(sp);
    r.status = st;
    return r;
  }
  p.tick = new_tick;
  if (fee_ && ctx.gas_price) fee_->observe(*ctx.gas_price);
  Quantity issued = 0;
  if (points_ && dir == Direction::ZeroForOne) issued = points_->issue(ctx.points_recipient, exact_in);

  r.amount_out = out;
  r.new_tick   = new_tick;

  if (listener_) {
    st = listener_->on_trade(TradeNotice{market, initiator, new_tick});
    if (st != Status::Ok) {
      balances_.rollback_to(sp);
      pools_.find(market)->second.tick = saved_tick;
      if (fee_) *fee_ = *saved_fee;
      if (issued > 0) points_->revoke(*ctx.points_recipient, issued);
      r.status     = st;
      r.amount_out = 0;
      r.new_tick   = saved_tick;
      return r;
    }
  }
  balances_.release_savepoint(sp);
  return r;
}

} // namespace tpe
