#include "tpe/fill_writer.hpp"
#include <cerrno>
#include <cstring>

namespace tpe {

bool FillWriter::open(const std::string& fills_csv, const std::string& results_csv) {
  close();
  ff_ = std::fopen(fills_csv.c_str(), "wb");
  if (!ff_) {
    std::fprintf(stderr, "FillWriter: failed to open fills CSV '%s': %s\n",
                 fills_csv.c_str(), std::strerror(errno));
    return false;
  }
  rf_ = std::fopen(results_csv.c_str(), "wb");
  if (!rf_) {
    std::fprintf(stderr, "FillWriter: failed to open results CSV '%s': %s\n",
                 results_csv.c_str(), std::strerror(errno));
    std::fclose(ff_); ff_ = nullptr;
    return false;
  }

  std::fprintf(ff_, "seq,market,tick,dir,amount_in,amount_out,new_tick\n");
  std::fprintf(rf_, "seq,op,status,value\n");
  return true;
}

void FillWriter::close() {
  if (ff_) {
    std::fflush(ff_);
    std::fclose(ff_);
    ff_ = nullptr;
  }
  if (rf_) {
    std::fflush(rf_);
    std::fclose(rf_);
    rf_ = nullptr;
  }
  last_fill_seq_.reset();
  last_result_seq_.reset();
}

void FillWriter::write_fill_row(SeqNo seq, MarketId market, Tick tick, Direction dir,
                                Quantity amount_in, Quantity amount_out, Tick new_tick) {
  if (!ff_) return;

  if (last_fill_seq_ && seq < *last_fill_seq_) {
    std::fprintf(stderr, "WARN: Non-monotonic fill seq: %llu < %llu\n",
                 (unsigned long long)seq, (unsigned long long)*last_fill_seq_);
  }
  last_fill_seq_ = seq;

  std::fprintf(ff_, "%llu,%llu,%lld,%d,%lld,%lld,%lld\n",
               (unsigned long long)seq, (unsigned long long)market, (long long)tick,
               static_cast<int>(dir), (long long)amount_in, (long long)amount_out,
               (long long)new_tick);
}

void FillWriter::write_result_row(SeqNo seq, const std::string& op, Status status,
                                  int64_t value) {
  if (!rf_) return;

  if (last_result_seq_ && seq < *last_result_seq_) {
    std::fprintf(stderr, "WARN: Non-monotonic result seq: %llu < %llu\n",
                 (unsigned long long)seq, (unsigned long long)*last_result_seq_);
  }
  last_result_seq_ = seq;

  std::fprintf(rf_, "%llu,%s,%s,%lld\n",
               (unsigned long long)seq, op.c_str(), to_string(status), (long long)value);
}

} // namespace tpe
