#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <algorithm>
#include <chrono>
#include <optional>
#include <random>

// Linux-only pinning headers (no-op elsewhere)
#if defined(__linux__)
  #include <sched.h>
  #include <pthread.h>
#endif

#include "tpe/engine.hpp"
#include "tpe/sim_market.hpp"
#include "tpe/types.hpp"

using namespace tpe;
using clk = std::chrono::steady_clock;

struct Args {
  uint64_t swaps   = 200'000;
  uint64_t orders  = 10'000;
  uint64_t warmup  = 5'000;
  long long spacing = 10;
  long long levels  = 200;          // levels on each side of the start tick
  long long depth   = 1'000;        // sim depth per tick
  long long max_swap = 50'000;      // swap sizes are uniform in [1, max_swap]
  int max_fills = 64;
  const char* out_csv = nullptr;
  std::optional<int> pin_core;
  uint64_t seed = 42;
} A;

static constexpr MarketId  BENCH_MARKET  = 1;
static constexpr AccountId MARKET_ACCT   = 0x4D;
static constexpr AccountId FIRST_TRADER  = 1'000;
static constexpr Quantity  FUNDING       = 1'000'000'000'000LL;

static bool arg_eq(const char* a, const char* b){ return std::strcmp(a,b)==0; }
static uint64_t to_u64(const char* s){
  char* e; auto v = std::strtoull(s,&e,10);
  if(*e) { std::fprintf(stderr,"bad int: %s\n",s); std::exit(2);}
  return v;
}
static void parse(int argc, char** argv){
  for (int i=1;i<argc;i++){
    if (arg_eq(argv[i],"--swaps") && i+1<argc)          { A.swaps = to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--orders") && i+1<argc)    { A.orders = to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--warmup") && i+1<argc)    { A.warmup = to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--spacing") && i+1<argc)   { A.spacing = (long long)to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--levels") && i+1<argc)    { A.levels = (long long)to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--depth") && i+1<argc)     { A.depth = (long long)to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--max-swap") && i+1<argc)  { A.max_swap = (long long)to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--max-fills") && i+1<argc) { A.max_fills = (int)to_u64(argv[++i]); }
    else if (arg_eq(argv[i],"--out-csv") && i+1<argc)   { A.out_csv = argv[++i]; }
    else if (arg_eq(argv[i],"--pin-core") && i+1<argc)  { A.pin_core = std::atoi(argv[++i]); }
    else if (arg_eq(argv[i],"--seed") && i+1<argc)      { A.seed = to_u64(argv[++i]); }
    else {
      std::fprintf(stderr,"Unknown arg: %s\n", argv[i]);
      std::fprintf(stderr,
        "Usage: %s [--swaps N] [--orders N] [--warmup N] [--spacing S] [--levels L] "
        "[--depth D] [--max-swap Q] [--max-fills F] [--out-csv path] [--pin-core N] "
        "[--seed N]\n", argv[0]);
      std::exit(2);
    }
  }
  if (A.spacing <= 0 || A.levels <= 0 || A.depth <= 0 || A.max_swap <= 0) {
    std::fprintf(stderr, "spacing, levels, depth and max-swap must be > 0\n");
    std::exit(2);
  }
  if (A.levels * A.spacing >= MAX_TICK) {
    std::fprintf(stderr, "levels * spacing must stay inside the tick range\n");
    std::exit(2);
  }
}

static void maybe_pin_core(std::optional<int> core){
#if defined(__linux__)
  if (!core) return;
  cpu_set_t set; CPU_ZERO(&set); CPU_SET(*core, &set);
  (void)pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
#else
  (void)core;
#endif
}

// RNG (deterministic when seed fixed)
static std::mt19937_64 RNG;

static Tick gen_level() {
  std::uniform_int_distribution<long long> dist(-A.levels, A.levels);
  return (Tick)(dist(RNG) * A.spacing);
}

// Orders above the price sell asset0 (fill on the way up), below sell asset1.
static Direction dir_for_level(Tick level) {
  return (level >= 0) ? Direction::ZeroForOne : Direction::OneForZero;
}

// Keep the price oscillating around the start tick so levels keep crossing.
static Direction gen_swap_dir(Tick current) {
  std::uniform_int_distribution<int> coin(0, 3);
  const bool bias = coin(RNG) != 0;
  if (current > 0) return bias ? Direction::ZeroForOne : Direction::OneForZero;
  return bias ? Direction::OneForZero : Direction::ZeroForOne;
}

int main(int argc, char** argv){
  parse(argc, argv);
  maybe_pin_core(A.pin_core);
  RNG.seed(A.seed);

  EngineOptions eopt;
  eopt.max_fills_per_cycle = A.max_fills;

  EngineState  state;
  BalanceSheet balances{eopt.self_id};
  SimMarket    market{balances, MARKET_ACCT};
  Engine       engine{state, market, balances, /*logger*/nullptr, eopt};
  market.set_listener(&engine);

  const MarketConfig cfg{BENCH_MARKET, 0, 1, (Tick)A.spacing};
  if (!market.create_market(cfg, 0, A.depth) || engine.initialize_market(cfg) != Status::Ok) {
    std::fprintf(stderr, "market setup failed\n");
    return 1;
  }
  balances.mint(cfg.asset0, MARKET_ACCT, FUNDING);
  balances.mint(cfg.asset1, MARKET_ACCT, FUNDING);

  const AccountId trader = FIRST_TRADER;
  balances.mint(cfg.asset0, trader, FUNDING);
  balances.mint(cfg.asset1, trader, FUNDING);

  // Seed the book from a pool of depositors
  uint64_t placed = 0;
  for (uint64_t i = 0; i < A.orders; ++i) {
    const AccountId who = FIRST_TRADER + 1 + (i % 64);
    const Tick lvl = gen_level();
    const Direction d = dir_for_level(lvl);
    balances.mint(input_asset(cfg, d), who, 1'000);
    if (engine.place_order(who, BENCH_MARKET, lvl, d, 1'000).status == Status::Ok) ++placed;
  }

  std::uniform_int_distribution<long long> size_dist(1, A.max_swap);

  for (uint64_t i = 0; i < A.warmup; ++i) {
    const Direction d = gen_swap_dir(market.current_tick(BENCH_MARKET));
    (void)market.swap(trader, BENCH_MARKET, d, size_dist(RNG));
  }

  std::vector<double> us; us.reserve(A.swaps);
  uint64_t fills = 0, failed = 0, deferred = 0;

  auto t0 = clk::now();
  for (uint64_t i = 0; i < A.swaps; ++i) {
    const Direction d = gen_swap_dir(market.current_tick(BENCH_MARKET));
    const Quantity q = size_dist(RNG);

    // Refill the book now and then so crossings keep happening
    if ((i & 63) == 0) {
      const AccountId who = FIRST_TRADER + 1 + (i % 64);
      const Tick lvl = gen_level();
      const Direction od = dir_for_level(lvl);
      balances.mint(input_asset(cfg, od), who, 1'000);
      (void)engine.place_order(who, BENCH_MARKET, lvl, od, 1'000);
    }

    auto s = clk::now();
    const TradeResult r = market.swap(trader, BENCH_MARKET, d, q);
    auto e = clk::now();
    us.push_back(std::chrono::duration<double,std::micro>(e-s).count());

    if (r.status != Status::Ok) { ++failed; continue; }
    fills += engine.last_cycle().fills.size();
    if (engine.last_cycle().deferred) ++deferred;
  }
  auto t1 = clk::now();

  const double wall_s = std::chrono::duration<double>(t1-t0).count();
  const double sps = A.swaps / wall_s;

  std::sort(us.begin(), us.end());
  auto pct = [&](double q){
    if (us.empty()) return 0.0;
    const double idx = q * (us.size()-1);
    const size_t i = (size_t)idx;
    const double frac = idx - i;
    if (i+1 < us.size()) return us[i]*(1.0-frac) + us[i+1]*frac;
    return us[i];
  };
  const double p50  = pct(0.50);
  const double p90  = pct(0.90);
  const double p99  = pct(0.99);
  const double p999 = pct(0.999);

  std::printf("swaps=%llu, time=%.3fs, rate=%.1f swaps/s, orders_placed=%llu\n",
              (unsigned long long)A.swaps, wall_s, sps, (unsigned long long)placed);
  std::printf("fills=%llu failed=%llu deferred_cycles=%llu live_levels=%zu\n",
              (unsigned long long)fills, (unsigned long long)failed,
              (unsigned long long)deferred, state.book.level_count());
  std::printf("latency_us: p50=%.3f p90=%.3f p99=%.3f p99.9=%.3f\n", p50, p90, p99, p999);

  if (A.out_csv){
    FILE* f = std::fopen(A.out_csv,"w");
    if (f){
      std::fprintf(f, "swaps,wall_s,rate_swaps_s,p50_us,p90_us,p99_us,p99_9_us,fills,failed,"
                      "deferred,spacing,levels,depth,max_fills,seed\n");
      std::fprintf(f, "%llu,%.6f,%.1f,%.6f,%.6f,%.6f,%.6f,%llu,%llu,%llu,%lld,%lld,%lld,%d,%llu\n",
        (unsigned long long)A.swaps, wall_s, sps, p50, p90, p99, p999,
        (unsigned long long)fills, (unsigned long long)failed, (unsigned long long)deferred,
        A.spacing, A.levels, A.depth, A.max_fills, (unsigned long long)A.seed);
      std::fclose(f);
    } else {
      std::fprintf(stderr, "failed to open %s\n", A.out_csv);
    }
  }
  return 0;
}
