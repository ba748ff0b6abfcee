#pragma once
#include <cstdio>
#include <string>
#include <cstdint>
#include <optional>
#include "types.hpp"

namespace tpe {

// Dependency-free CSV writer for replay output.
// fills_csv columns:
//   seq,market,tick,dir,amount_in,amount_out,new_tick
// results_csv columns (one row per input command):
//   seq,op,status,value
class FillWriter {
public:
  FillWriter() = default;
  ~FillWriter() { close(); }

  FillWriter(const FillWriter&) = delete;
  FillWriter& operator=(const FillWriter&) = delete;

  // Open CSVs; writes headers.
  bool open(const std::string& fills_csv, const std::string& results_csv);

  // Close files if open (flushes).
  void close();

  void write_fill_row(SeqNo seq, MarketId market, Tick tick, Direction dir,
                      Quantity amount_in, Quantity amount_out, Tick new_tick);

  // value: resolved tick for place, payout for redeem, output for swap
  void write_result_row(SeqNo seq, const std::string& op, Status status, int64_t value);

private:
  std::FILE* ff_ = nullptr;
  std::FILE* rf_ = nullptr;

  // Monotonicity best-effort warnings (we don't throw).
  std::optional<SeqNo> last_fill_seq_;
  std::optional<SeqNo> last_result_seq_;
};

} // namespace tpe
