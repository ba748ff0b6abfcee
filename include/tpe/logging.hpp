#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include "types.hpp"
#include "order_book.hpp"
#include "state.hpp"

namespace tpe {

// ---------- Binary record layouts (for tests/replay) ----------
#pragma pack(push, 1)
struct FillBin {
  SeqNo    seq;            // event counter at which the fill was logged
  MarketId market;
  Tick     tick;
  uint8_t  dir;            // 0=ZeroForOne, 1=OneForZero
  Quantity amount_in;
  Quantity amount_out;
  Tick     new_tick;
};

enum class EventType : uint8_t { Place=0, Cancel=1, Redeem=2, InitMarket=3, CycleAbort=4 };

struct EventBin {
  SeqNo     seq;
  EventType type;
  AccountId account;
  MarketId  market;
  Tick      tick;
  uint8_t   dir;
  Quantity  qty;       // input amount / shares
  Quantity  out;       // redeem payout; status code for CycleAbort
};
#pragma pack(pop)

// ---------- Snapshot format ----------
#pragma pack(push, 1)
struct SnapshotHeader {
  uint32_t magic      = 0x53455054; // "TPES"
  uint32_t version    = 1;
  SeqNo    seq        = 0;
  uint32_t n_markets  = 0;
  uint32_t n_orders   = 0;
  uint32_t n_balances = 0;
  uint32_t n_positions= 0;
};

struct SnapshotMarketRec {
  MarketId id;
  AssetId  asset0;
  AssetId  asset1;
  Tick     spacing;
  Tick     last_tick;
  uint8_t  has_deferred;   // 1 if deferred_to is set
  Tick     deferred_to;
};

struct SnapshotOrderRec {
  MarketId market;
  Tick     tick;
  uint8_t  dir;
  Quantity qty;
};

struct SnapshotBalanceRec {
  uint8_t   pos[32];
  AccountId owner;
  Quantity  shares;
};

struct SnapshotPositionRec {
  uint8_t  pos[32];
  Quantity claimable;
};
#pragma pack(pop)

// Write a snapshot of the full engine state.
class SnapshotWriter {
public:
  explicit SnapshotWriter(std::string out_dir) : out_dir_(std::move(out_dir)) {}
  static std::string join(const std::string& a, const std::string& b) {
    if (!a.empty() && a.back() == '/') return a + b;
    return a + "/" + b;
  }
  std::string path_for(SeqNo seq) const {
    return join(out_dir_, "snapshot_seq" + std::to_string(seq) + ".bin");
  }

  bool write_snapshot(const EngineState& state, SeqNo seq);

private:
  std::string out_dir_;
};

// Load a snapshot into an empty EngineState. Claim supply is rebuilt from
// the balances.
bool load_snapshot_file(const std::string& path, EngineState& state, SeqNo& out_seq);

// ---------- Event logging interface ----------
class IEventLogger {
public:
  virtual ~IEventLogger() = default;

  virtual void log_init(const MarketConfig& cfg, Tick tick) = 0;

  virtual void log_place(AccountId who, const OrderKey& k, Quantity amount) = 0;

  virtual void log_cancel(AccountId who, const OrderKey& k, Quantity amount) = 0;

  virtual void log_redeem(AccountId who, const OrderKey& k,
                          Quantity shares, Quantity amount_out) = 0;

  virtual void log_fill(const OrderKey& k, Quantity amount_in,
                        Quantity amount_out, Tick new_tick) = 0;

  // A trigger cycle failed and was rolled back.
  virtual void log_cycle_abort(MarketId market, Status why) = 0;

  // Hook: lets the engine hand its state to the logger for snapshots.
  virtual void set_snapshot_source(const EngineState* /*state*/) {}

  // Called by the engine after it finishes mutating state for an event.
  virtual void on_after_event() {}

  virtual void flush() {}
};

// ---------- Concrete logger (jsonl + binary) ----------
class JsonlBinLogger final : public IEventLogger {
public:
  // base_path (without extension) e.g. "artifacts/runA"
  JsonlBinLogger(const std::string& base_path,
                 int snapshot_every,
                 SnapshotWriter* snap_writer);

  // paths used by tests
  std::string jsonl_path() const { return jsonl_path_; }
  std::string fills_bin_path() const { return fills_path_; }
  std::string events_bin_path() const { return events_path_; }
  SeqNo event_count() const { return event_count_; }

  // IEventLogger
  void log_init(const MarketConfig& cfg, Tick tick) override;
  void log_place(AccountId who, const OrderKey& k, Quantity amount) override;
  void log_cancel(AccountId who, const OrderKey& k, Quantity amount) override;
  void log_redeem(AccountId who, const OrderKey& k,
                  Quantity shares, Quantity amount_out) override;
  void log_fill(const OrderKey& k, Quantity amount_in,
                Quantity amount_out, Tick new_tick) override;
  void log_cycle_abort(MarketId market, Status why) override;

  void set_snapshot_source(const EngineState* state) override;

  void on_after_event() override;

  void flush() override;

private:
  void write_event(EventType type, AccountId who, MarketId market, Tick tick,
                   Direction dir, Quantity qty, Quantity out);
  void maybe_snapshot();

  // files/streams
  std::string base_path_;
  std::string jsonl_path_;
  std::string fills_path_;
  std::string events_path_;
  std::ofstream jsonl_;
  std::ofstream fills_bin_;
  std::ofstream events_bin_;

  // snapshot
  int snapshot_every_{0};
  SeqNo event_count_{0};      // increments on every logged event
  SeqNo last_snapshot_at_{0};
  SnapshotWriter* snap_{nullptr};
  const EngineState* state_src_{nullptr};
};

} // namespace tpe
