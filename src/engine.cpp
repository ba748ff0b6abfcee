#include "tpe/engine.hpp"
#include <limits>

namespace tpe {

Status Engine::initialize_market(const MarketConfig& cfg) {
  if (cfg.spacing <= 0) return Status::InvalidOrder;
  if (state_.markets.count(cfg.id) != 0) return Status::InvalidOrder;

  const Tick tick = market_.current_tick(cfg.id);
  if (!in_tick_range(tick)) return Status::InvalidOrder;
  state_.markets.emplace(cfg.id, TrackedMarket{cfg, tick, std::nullopt});

  if (logger_) {
    logger_->log_init(cfg, tick);
    logger_->on_after_event();
  }
  return Status::Ok;
}

PlaceResult Engine::place_order(AccountId caller, MarketId market, Tick target_tick,
                                Direction dir, Quantity amount) {
  PlaceResult r{};
  const TrackedMarket* m = find_market(market);
  if (!m || amount <= 0 || !in_tick_range(target_tick)) {
    r.status = Status::InvalidOrder;
    return r;
  }

  const OrderKey key{market, resolve_level(target_tick, m->cfg.spacing), dir};
  const PositionId pos = make_position_id(key.market, key.tick, key.dir);
  r.tick = key.tick;

  // reject overflow before any custody moves; shares of a filled level are
  // still outstanding, so supply can exceed the pending aggregate
  if (state_.book.pending(key) > std::numeric_limits<Quantity>::max() - amount ||
      !state_.ledger.can_deposit(pos, caller, amount)) {
    r.status = Status::InvalidOrder;
    return r;
  }

  r.status = transfers_.transfer_in(input_asset(m->cfg, dir), caller, amount);
  if (r.status != Status::Ok) return r;

  // both guarded above
  (void) state_.book.add(key, amount);
  (void) state_.ledger.deposit(pos, caller, amount);

  if (logger_) {
    logger_->log_place(caller, key, amount);
    logger_->on_after_event();
  }
  return r;
}

Status Engine::cancel_order(AccountId caller, MarketId market, Tick level,
                            Direction dir, Quantity amount) {
  const TrackedMarket* m = find_market(market);
  if (!m || amount <= 0) return Status::InvalidOrder;

  const OrderKey key{market, resolve_level(level, m->cfg.spacing), dir};
  const PositionId pos = make_position_id(key.market, key.tick, key.dir);

  if (state_.ledger.balance_of(pos, caller) < amount) return Status::InsufficientShare;
  // shares outlive a fill; the aggregate does not
  if (state_.book.pending(key) < amount) return Status::InvalidOrder;

  const Status st = transfers_.transfer_out(input_asset(m->cfg, dir), caller, amount);
  if (st != Status::Ok) return st;

  // both checked above
  (void) state_.ledger.withdraw(pos, caller, amount);
  (void) state_.book.remove(key, amount);

  if (logger_) {
    logger_->log_cancel(caller, key, amount);
    logger_->on_after_event();
  }
  return Status::Ok;
}

RedeemResult Engine::redeem(AccountId caller, MarketId market, Tick level,
                            Direction dir, Quantity shares) {
  RedeemResult r{};
  const TrackedMarket* m = find_market(market);
  if (!m) { r.status = Status::InvalidOrder; return r; }

  const OrderKey key{market, resolve_level(level, m->cfg.spacing), dir};
  const PositionId pos = make_position_id(key.market, key.tick, key.dir);

  const RedeemQuote q = state_.ledger.quote_redeem(pos, caller, shares);
  if (q.status != Status::Ok) { r.status = q.status; return r; }

  r.status = transfers_.transfer_out(output_asset(m->cfg, dir), caller, q.amount_out);
  if (r.status != Status::Ok) return r;

  const RedeemQuote done = state_.ledger.redeem(pos, caller, shares);
  r.status     = done.status;
  r.amount_out = done.amount_out;

  if (logger_) {
    logger_->log_redeem(caller, key, shares, r.amount_out);
    logger_->on_after_event();
  }
  return r;
}

PositionId Engine::position_id(MarketId market, Tick level, Direction dir) const {
  const TrackedMarket* m = find_market(market);
  const Tick t = m ? resolve_level(level, m->cfg.spacing) : level;
  return make_position_id(market, t, dir);
}

Status Engine::on_trade(const TradeNotice& notice) {
  // our own executions report back here; acting on them would recurse
  if (notice.initiator == opt_.self_id) return Status::Ok;

  last_cycle_ = CycleResult{};
  if (!find_market(notice.market)) return Status::Ok;

  last_cycle_ = run_cycle(notice.market);
  return last_cycle_.status;
}

void Engine::rollback(const std::vector<UndoEntry>& undo) {
  // newest first so repeated keys end at their oldest value
  for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
    state_.book.set_pending(it->key, it->pending_before);
    state_.ledger.set_claimable(it->pos, it->claimable_before);
  }
}

Status Engine::sweep(TrackedMarket& m, Tick& end, bool follow_market,
                     CycleResult& r, std::vector<UndoEntry>& undo) {
  const CrossingScanner scanner(state_.book);

  while (true) {
    const std::optional<Crossing> hit =
        scanner.find(m.cfg.id, m.cfg.spacing, m.last_tick, end);
    if (!hit) return Status::Ok;

    if (opt_.max_fills_per_cycle > 0 &&
        static_cast<int>(r.fills.size()) >= opt_.max_fills_per_cycle) {
      r.deferred = true;
      return Status::Ok;
    }

    const TradeResult tr = market_.execute_trade(opt_.self_id, m.cfg.id, hit->dir, hit->amount);
    if (tr.status != Status::Ok) return tr.status;

    const OrderKey key{m.cfg.id, hit->tick, hit->dir};
    const PositionId pos = make_position_id(key.market, key.tick, key.dir);
    undo.push_back(UndoEntry{key, state_.book.pending(key), pos, state_.ledger.claimable(pos)});

    // whole aggregate executed: the level empties
    (void) state_.book.remove(key, hit->amount);
    const Status st = state_.ledger.credit(pos, tr.amount_out);
    if (st != Status::Ok) return st;

    r.fills.push_back(Fill{key, hit->amount, tr.amount_out, tr.new_tick});
    if (follow_market) end = tr.new_tick;
  }
}

CycleResult Engine::run_cycle(MarketId market) {
  CycleResult r{};
  TrackedMarket* m = find_market(market);
  if (!m) { r.status = Status::InvalidOrder; return r; }

  const TrackedMarket before = *m;
  std::vector<UndoEntry> undo;
  Status st = Status::Ok;

  // finish the range an earlier, bounded cycle left behind
  if (m->deferred_to) {
    Tick end = *m->deferred_to;
    st = sweep(*m, end, /*follow_market*/ false, r, undo);
    if (st == Status::Ok && !r.deferred) {
      m->last_tick = end;
      m->deferred_to.reset();
    }
  }

  if (st == Status::Ok && !r.deferred) {
    Tick current = market_.current_tick(market);
    st = sweep(*m, current, /*follow_market*/ true, r, undo);
    if (st == Status::Ok) {
      if (r.deferred) m->deferred_to = current;
      else            m->last_tick = current;
    }
  }

  if (st != Status::Ok) {
    rollback(undo);
    *m = before;
    r.status = st;
    r.fills.clear();
    r.deferred = false;
    r.last_tick = m->last_tick;
    if (logger_) {
      logger_->log_cycle_abort(market, r.status);
      logger_->on_after_event();
    }
    return r;
  }

  r.last_tick = m->last_tick;

  if (logger_ && !r.fills.empty()) {
    for (const Fill& f : r.fills) logger_->log_fill(f.key, f.amount_in, f.amount_out, f.new_tick);
    logger_->on_after_event();
  }
  return r;
}

std::optional<Tick> Engine::last_tick(MarketId market) const {
  const TrackedMarket* m = find_market(market);
  if (!m) return std::nullopt;
  return m->last_tick;
}

Quantity Engine::pending(MarketId market, Tick level, Direction dir) const {
  const TrackedMarket* m = find_market(market);
  if (!m) return 0;
  return state_.book.pending(OrderKey{market, resolve_level(level, m->cfg.spacing), dir});
}

Quantity Engine::share_of(AccountId owner, MarketId market, Tick level, Direction dir) const {
  return state_.ledger.balance_of(position_id(market, level, dir), owner);
}

Quantity Engine::claimable(MarketId market, Tick level, Direction dir) const {
  return state_.ledger.claimable(position_id(market, level, dir));
}

} // namespace tpe
