#include "tpe/logging.hpp"
#include <cstring>
#include <filesystem>

namespace tpe {

// ---- SnapshotWriter ----
bool SnapshotWriter::write_snapshot(const EngineState& state, SeqNo seq) {
  std::filesystem::create_directories(out_dir_);
  std::string path = path_for(seq);
  std::ofstream out(path, std::ios::binary);
  if (!out) return false;

  std::vector<SnapshotMarketRec> mkts;
  mkts.reserve(state.markets.size());
  for (const auto& kv : state.markets) {
    const TrackedMarket& m = kv.second;
    mkts.push_back(SnapshotMarketRec{m.cfg.id, m.cfg.asset0, m.cfg.asset1,
                                     m.cfg.spacing, m.last_tick,
                                     static_cast<uint8_t>(m.deferred_to ? 1 : 0),
                                     m.deferred_to.value_or(0)});
  }

  std::vector<SnapshotOrderRec> orders;
  state.book.for_each_nonempty([&](const OrderKey& k, Quantity q){
    orders.push_back(SnapshotOrderRec{k.market, k.tick, static_cast<uint8_t>(k.dir), q});
  });

  std::vector<SnapshotBalanceRec> balances;
  state.ledger.for_each_balance([&](const PositionId& p, AccountId owner, Quantity shares){
    SnapshotBalanceRec r{};
    std::memcpy(r.pos, p.bytes.data(), sizeof(r.pos));
    r.owner  = owner;
    r.shares = shares;
    balances.push_back(r);
  });

  // supply is implied by the balances; only claimable output needs storing
  std::vector<SnapshotPositionRec> positions;
  state.ledger.for_each_position([&](const PositionId& p, Quantity, Quantity claimable){
    if (claimable <= 0) return;
    SnapshotPositionRec r{};
    std::memcpy(r.pos, p.bytes.data(), sizeof(r.pos));
    r.claimable = claimable;
    positions.push_back(r);
  });

  SnapshotHeader hdr;
  hdr.seq         = seq;
  hdr.n_markets   = static_cast<uint32_t>(mkts.size());
  hdr.n_orders    = static_cast<uint32_t>(orders.size());
  hdr.n_balances  = static_cast<uint32_t>(balances.size());
  hdr.n_positions = static_cast<uint32_t>(positions.size());

  out.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
  if (!out) return false;

  auto write_all = [&out](const auto& v) -> bool {
    if (v.empty()) return true;
    out.write(reinterpret_cast<const char*>(v.data()),
              static_cast<std::streamsize>(sizeof(v[0]) * v.size()));
    return static_cast<bool>(out);
  };

  return write_all(mkts) && write_all(orders) && write_all(balances) && write_all(positions);
}

// ---- load_snapshot_file ----
bool load_snapshot_file(const std::string& path, EngineState& state, SeqNo& out_seq) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;

  SnapshotHeader hdr{};
  in.read(reinterpret_cast<char*>(&hdr), sizeof(hdr));
  if (!in) return false;
  if (hdr.magic != 0x53455054 || hdr.version != 1) return false;

  out_seq = hdr.seq;

  for (uint32_t i = 0; i < hdr.n_markets; ++i) {
    SnapshotMarketRec rec{};
    in.read(reinterpret_cast<char*>(&rec), sizeof(rec));
    if (!in) return false;
    if (rec.spacing <= 0 || rec.has_deferred > 1) return false;
    std::optional<Tick> deferred;
    if (rec.has_deferred) deferred = rec.deferred_to;
    state.markets[rec.id] = TrackedMarket{
        MarketConfig{rec.id, rec.asset0, rec.asset1, rec.spacing}, rec.last_tick, deferred};
  }

  for (uint32_t i = 0; i < hdr.n_orders; ++i) {
    SnapshotOrderRec rec{};
    in.read(reinterpret_cast<char*>(&rec), sizeof(rec));
    if (!in) return false;
    if (rec.dir > 1) return false;
    state.book.set_pending(OrderKey{rec.market, rec.tick, static_cast<Direction>(rec.dir)},
                           rec.qty);
  }

  for (uint32_t i = 0; i < hdr.n_balances; ++i) {
    SnapshotBalanceRec rec{};
    in.read(reinterpret_cast<char*>(&rec), sizeof(rec));
    if (!in) return false;
    PositionId p;
    std::memcpy(p.bytes.data(), rec.pos, sizeof(rec.pos));
    if (state.ledger.deposit(p, rec.owner, rec.shares) != Status::Ok) return false;
  }

  for (uint32_t i = 0; i < hdr.n_positions; ++i) {
    SnapshotPositionRec rec{};
    in.read(reinterpret_cast<char*>(&rec), sizeof(rec));
    if (!in) return false;
    PositionId p;
    std::memcpy(p.bytes.data(), rec.pos, sizeof(rec.pos));
    if (rec.claimable < 0) return false;
    state.ledger.set_claimable(p, rec.claimable);
  }

  return true;
}

// ---- JsonlBinLogger ----
JsonlBinLogger::JsonlBinLogger(const std::string& base_path,
                               int snapshot_every,
                               SnapshotWriter* snap_writer)
  : base_path_(base_path),
    jsonl_path_(base_path + ".jsonl"),
    fills_path_(base_path + ".fills.bin"),
    events_path_(base_path + ".events.bin"),
    snapshot_every_(snapshot_every),
    snap_(snap_writer) {
  const auto parent = std::filesystem::path(base_path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
  }
  jsonl_.open(jsonl_path_, std::ios::out | std::ios::trunc);
  fills_bin_.open(fills_path_, std::ios::binary | std::ios::trunc);
  events_bin_.open(events_path_, std::ios::binary | std::ios::trunc);
}

void JsonlBinLogger::set_snapshot_source(const EngineState* state) {
  state_src_ = state;
}

void JsonlBinLogger::write_event(EventType type, AccountId who, MarketId market, Tick tick,
                                 Direction dir, Quantity qty, Quantity out) {
  EventBin e{};
  e.seq     = ++event_count_;
  e.type    = type;
  e.account = who;
  e.market  = market;
  e.tick    = tick;
  e.dir     = static_cast<uint8_t>(dir);
  e.qty     = qty;
  e.out     = out;
  events_bin_.write(reinterpret_cast<const char*>(&e), sizeof(e));
}

void JsonlBinLogger::log_init(const MarketConfig& cfg, Tick tick) {
  write_event(EventType::InitMarket, 0, cfg.id, tick, Direction::ZeroForOne, cfg.spacing, 0);
  if (jsonl_) {
    jsonl_ << "{\"type\":\"init\",\"seq\":" << event_count_
           << ",\"market\":" << cfg.id
           << ",\"asset0\":" << cfg.asset0 << ",\"asset1\":" << cfg.asset1
           << ",\"spacing\":" << cfg.spacing << ",\"tick\":" << tick << "}\n";
  }
}

void JsonlBinLogger::log_place(AccountId who, const OrderKey& k, Quantity amount) {
  write_event(EventType::Place, who, k.market, k.tick, k.dir, amount, 0);
  if (jsonl_) {
    jsonl_ << "{\"type\":\"place\",\"seq\":" << event_count_
           << ",\"account\":" << who << ",\"market\":" << k.market
           << ",\"tick\":" << k.tick << ",\"dir\":\"" << to_string(k.dir) << "\""
           << ",\"amount\":" << amount << "}\n";
  }
}

void JsonlBinLogger::log_cancel(AccountId who, const OrderKey& k, Quantity amount) {
  write_event(EventType::Cancel, who, k.market, k.tick, k.dir, amount, 0);
  if (jsonl_) {
    jsonl_ << "{\"type\":\"cancel\",\"seq\":" << event_count_
           << ",\"account\":" << who << ",\"market\":" << k.market
           << ",\"tick\":" << k.tick << ",\"dir\":\"" << to_string(k.dir) << "\""
           << ",\"amount\":" << amount << "}\n";
  }
}

void JsonlBinLogger::log_redeem(AccountId who, const OrderKey& k,
                                Quantity shares, Quantity amount_out) {
  write_event(EventType::Redeem, who, k.market, k.tick, k.dir, shares, amount_out);
  if (jsonl_) {
    jsonl_ << "{\"type\":\"redeem\",\"seq\":" << event_count_
           << ",\"account\":" << who << ",\"market\":" << k.market
           << ",\"tick\":" << k.tick << ",\"dir\":\"" << to_string(k.dir) << "\""
           << ",\"shares\":" << shares << ",\"out\":" << amount_out << "}\n";
  }
}

void JsonlBinLogger::log_fill(const OrderKey& k, Quantity amount_in,
                              Quantity amount_out, Tick new_tick) {
  FillBin f{};
  f.seq        = ++event_count_;
  f.market     = k.market;
  f.tick       = k.tick;
  f.dir        = static_cast<uint8_t>(k.dir);
  f.amount_in  = amount_in;
  f.amount_out = amount_out;
  f.new_tick   = new_tick;
  fills_bin_.write(reinterpret_cast<const char*>(&f), sizeof(f));

  if (jsonl_) {
    jsonl_ << "{\"type\":\"fill\",\"seq\":" << f.seq
           << ",\"market\":" << k.market << ",\"tick\":" << k.tick
           << ",\"dir\":\"" << to_string(k.dir) << "\""
           << ",\"in\":" << amount_in << ",\"out\":" << amount_out
           << ",\"new_tick\":" << new_tick << "}\n";
  }
}

void JsonlBinLogger::log_cycle_abort(MarketId market, Status why) {
  write_event(EventType::CycleAbort, 0, market, 0, Direction::ZeroForOne, 0,
              static_cast<Quantity>(why));
  if (jsonl_) {
    jsonl_ << "{\"type\":\"abort\",\"seq\":" << event_count_
           << ",\"market\":" << market
           << ",\"status\":\"" << to_string(why) << "\"}\n";
  }
}

void JsonlBinLogger::on_after_event() {
  maybe_snapshot();
}

void JsonlBinLogger::maybe_snapshot() {
  if (!snap_ || snapshot_every_ <= 0) return;
  if (!state_src_) return;
  if (event_count_ == 0 || event_count_ == last_snapshot_at_) return;
  if (event_count_ - last_snapshot_at_ < static_cast<SeqNo>(snapshot_every_)) return;
  if (snap_->write_snapshot(*state_src_, event_count_)) last_snapshot_at_ = event_count_;
}

void JsonlBinLogger::flush() {
  if (jsonl_) jsonl_.flush();
  if (fills_bin_) fills_bin_.flush();
  if (events_bin_) events_bin_.flush();
}

} // namespace tpe
