// tools/replay.cpp
#include "tpe/engine.hpp"
#include "tpe/fill_writer.hpp"
#include "tpe/logging.hpp"
#include "tpe/replay.hpp"
#include "tpe/sim_market.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using namespace tpe;

static void usage() {
  std::fprintf(stderr,
R"(tpe replay --file <commands.csv> [--fills-out <fills.csv>] [--results-out <results.csv>]
           [--log-base <path>] [--snapshot-every N] [--snapshot-in SNAP.bin]
           [--snapshot-out DIR] [--max-fills N] [--dynamic-fee PIPS] [--points]
           [--stop-on-error]

Required:
  --file            Command CSV with columns: seq,op,account,market,tick,dir,amount,spacing

Options:
  --fills-out       Fills CSV path (default fills.csv)
  --results-out     Per-command results CSV path (default results.csv)
  --log-base        Write <base>.jsonl / .events.bin / .fills.bin
  --snapshot-every  With --log-base: snapshot every N events into --snapshot-out
  --snapshot-in     Resume from a snapshot (markets must be re-created by init rows
                    in the simulated market; the engine keeps the restored state)
  --snapshot-out    Directory for snapshots; a final snapshot is always written here
  --max-fills       Fill bound per trigger cycle (default 64, 0 = unbounded)
  --dynamic-fee     Enable the moving-average fee with this base fee in pips
  --points          Award loyalty points to swap initiators
  --stop-on-error   Abort on the first rejected command

Example:
  tpe replay --file session.csv --fills-out out/fills.csv --results-out out/results.csv \
             --log-base out/run --snapshot-out out/snaps
)");
}

int main(int argc, char** argv) {
  std::string file;
  std::string fills_csv   = "fills.csv";
  std::string results_csv = "results.csv";
  std::string log_base;
  std::string snapshot_in;
  std::string snapshot_out;
  int snapshot_every = 0;
  int max_fills = 64;
  long long dynamic_fee = -1;
  bool award_points = false;
  bool stop_on_error = false;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--file") { if (i+1>=argc){usage();return 2;} file = argv[++i]; }
    else if (a == "--fills-out") {
      if (i+1>=argc){usage();return 2;}
      fills_csv = argv[++i];
    }
    else if (a == "--results-out") {
      if (i+1>=argc){usage();return 2;}
      results_csv = argv[++i];
    }
    else if (a == "--log-base") {
      if (i+1>=argc){usage();return 2;}
      log_base = argv[++i];
    }
    else if (a == "--snapshot-every") {
      if (i+1>=argc){usage();return 2;}
      snapshot_every = std::atoi(argv[++i]);
      if (snapshot_every < 0) snapshot_every = 0;
    }
    else if (a == "--snapshot-in") {
      if (i+1>=argc){usage();return 2;}
      snapshot_in = argv[++i];
    }
    else if (a == "--snapshot-out") {
      if (i+1>=argc){usage();return 2;}
      snapshot_out = argv[++i];
    }
    else if (a == "--max-fills") {
      if (i+1>=argc){usage();return 2;}
      max_fills = std::atoi(argv[++i]);
      if (max_fills < 0) max_fills = 0;
    }
    else if (a == "--dynamic-fee") {
      if (i+1>=argc){usage();return 2;}
      dynamic_fee = std::atoll(argv[++i]);
      if (dynamic_fee < 0 || dynamic_fee > 1'000'000) {
        std::fprintf(stderr, "--dynamic-fee must be in [0, 1000000] pips\n");
        return 2;
      }
    }
    else if (a == "--points") {
      award_points = true;
    }
    else if (a == "--stop-on-error") {
      stop_on_error = true;
    }
    else if (a == "-h" || a == "--help") {
      usage(); return 0;
    }
    else {
      std::fprintf(stderr, "Unknown arg: %s\n", a.c_str());
      usage();
      return 2;
    }
  }

  if (file.empty()) {
    usage();
    return 2;
  }

  // Seed state (empty or from snapshot_in)
  EngineState state;
  SeqNo snap_seq{0};
  if (!snapshot_in.empty()) {
    if (!load_snapshot_file(snapshot_in, state, snap_seq)) {
      std::fprintf(stderr, "Failed to load snapshot: %s\n", snapshot_in.c_str());
      return 1;
    }
    std::fprintf(stderr, "[replay] loaded snapshot seq=%llu markets=%zu levels=%zu\n",
                 (unsigned long long)snap_seq, state.markets.size(), state.book.level_count());
  }

  // Load commands
  std::vector<Command> cmds;
  if (!load_command_csv(file, cmds)) {
    return 2;
  }
  if (cmds.empty()) {
    std::fprintf(stderr, "No rows in input.\n");
    return 2;
  }
  std::stable_sort(cmds.begin(), cmds.end(),
                   [](const Command& x, const Command& y){ return x.seq < y.seq; });

  // Wire up the simulated venue and the engine
  EngineOptions eopt;
  eopt.max_fills_per_cycle = max_fills;

  BalanceSheet balances{eopt.self_id};
  SimMarket market{balances, /*market_account*/ 0x4D};

  std::unique_ptr<MovingAverageFee> fee;
  if (dynamic_fee >= 0) {
    fee = std::make_unique<MovingAverageFee>(static_cast<uint32_t>(dynamic_fee));
    market.set_fee_model(fee.get());
  }
  PointsLedger points;
  if (award_points) market.set_points(&points);

  std::unique_ptr<SnapshotWriter> snap_writer;
  if (!snapshot_out.empty()) snap_writer = std::make_unique<SnapshotWriter>(snapshot_out);

  std::unique_ptr<JsonlBinLogger> logger;
  if (!log_base.empty()) {
    logger = std::make_unique<JsonlBinLogger>(log_base, snapshot_every, snap_writer.get());
  }

  Engine engine{state, market, balances, logger.get(), eopt};
  market.set_listener(&engine);

  FillWriter writer;
  if (!writer.open(fills_csv, results_csv)) {
    return 2;
  }

  Replayer::Options opt;
  opt.stop_on_error = stop_on_error;
  opt.award_points  = award_points;

  Replayer rp(engine, market, balances, &writer);
  const bool ok = rp.run(cmds, opt);
  writer.close();
  if (logger) logger->flush();

  if (snap_writer) {
    const SeqNo final_seq = snap_seq + static_cast<SeqNo>(cmds.size());
    if (!snap_writer->write_snapshot(state, final_seq)) {
      std::fprintf(stderr, "[replay] ERROR writing snapshot to %s\n", snapshot_out.c_str());
      return 1;
    }
    std::fprintf(stderr, "[replay] wrote %s\n", snap_writer->path_for(final_seq).c_str());
  }

  const auto& t = rp.totals();
  std::fprintf(stderr, "[replay] done. ok=%zu rejected=%zu fills=%zu points=%lld\n",
               t.ok, t.rejected, t.fills, (long long)points.total_issued());
  return ok ? 0 : 3;
}
