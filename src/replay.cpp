#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <string>
#include <vector>

#include "tpe/replay.hpp"

namespace tpe {

// -----------------------------
// CSV loader (tiny & strict)
// -----------------------------
static inline std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && std::isspace((unsigned char)s[i])) ++i;
  while (j > i && std::isspace((unsigned char)s[j-1])) --j;
  return s.substr(i, j - i);
}

static bool parse_op(const std::string& t, CmdType& out) {
  std::string x = t;
  for (auto& c : x) c = (char)std::tolower((unsigned char)c);
  if (x == "init")   { out = CmdType::Init;   return true; }
  if (x == "fund")   { out = CmdType::Fund;   return true; }
  if (x == "place")  { out = CmdType::Place;  return true; }
  if (x == "cancel") { out = CmdType::Cancel; return true; }
  if (x == "redeem") { out = CmdType::Redeem; return true; }
  if (x == "swap")   { out = CmdType::Swap;   return true; }
  return false;
}

static bool parse_dir(const std::string& s, Direction& out) {
  if (s.empty() || s == "0") { out = Direction::ZeroForOne; return true; }
  if (s == "1")              { out = Direction::OneForZero; return true; }
  return false;
}

const char* to_string(CmdType t) {
  switch (t) {
    case CmdType::Init:   return "init";
    case CmdType::Fund:   return "fund";
    case CmdType::Place:  return "place";
    case CmdType::Cancel: return "cancel";
    case CmdType::Redeem: return "redeem";
    case CmdType::Swap:   return "swap";
  }
  return "?";
}

bool load_command_csv(const std::string& path, std::vector<Command>& out) {
  out.clear();
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    std::fprintf(stderr, "Failed to open command CSV '%s': %s\n",
                 path.c_str(), std::strerror(errno));
    return false;
  }

  char* line = nullptr;
  size_t cap = 0;
  ssize_t n = 0;

  // header
  n = getline(&line, &cap, f);
  if (n <= 0) {
    std::fprintf(stderr, "Empty CSV: %s\n", path.c_str());
    std::free(line);
    std::fclose(f);
    return false;
  }
  std::string header(line, (size_t)n);
  if (header.find("seq")     == std::string::npos ||
      header.find("op")      == std::string::npos ||
      header.find("account") == std::string::npos ||
      header.find("market")  == std::string::npos ||
      header.find("amount")  == std::string::npos) {
    std::fprintf(stderr, "Unexpected CSV header for '%s'. Expected: "
                         "seq,op,account,market,tick,dir,amount,spacing\n", path.c_str());
    std::free(line);
    std::fclose(f);
    return false;
  }

  auto next_field = [](const char* s, size_t& i, size_t N)->std::string {
    size_t start = i;
    while (i < N && s[i] != ',' && s[i] != '\n' && s[i] != '\r') ++i;
    std::string v(s + start, i - start);
    if (i < N && s[i] == ',') ++i;
    return trim(v);
  };

  size_t line_no = 1;
  while ((n = getline(&line, &cap, f)) > 0) {
    ++line_no;
    const size_t N = (size_t)n;
    size_t i = 0;
    std::string f_seq     = next_field(line, i, N);
    std::string f_op      = next_field(line, i, N);
    std::string f_account = next_field(line, i, N);
    std::string f_market  = next_field(line, i, N);
    std::string f_tick    = next_field(line, i, N);
    std::string f_dir     = next_field(line, i, N);
    std::string f_amount  = next_field(line, i, N);
    std::string f_spacing = next_field(line, i, N);

    if (f_seq.empty() || f_seq[0] == '#') continue;

    Command c{};
    c.seq = std::strtoull(f_seq.c_str(), nullptr, 10);

    if (!parse_op(f_op, c.type)) {
      std::fprintf(stderr, "line %zu: bad op '%s'\n", line_no, f_op.c_str());
      continue;
    }
    if (!parse_dir(f_dir, c.dir)) {
      std::fprintf(stderr, "line %zu: bad dir '%s'\n", line_no, f_dir.c_str());
      continue;
    }
    c.account = std::strtoull(f_account.c_str(), nullptr, 10);
    c.market  = std::strtoull(f_market.c_str(), nullptr, 10);
    c.tick    = std::strtoll(f_tick.c_str(), nullptr, 10);
    c.amount  = std::strtoll(f_amount.c_str(), nullptr, 10);
    c.spacing = f_spacing.empty() ? 0 : std::strtoll(f_spacing.c_str(), nullptr, 10);

    if (c.type == CmdType::Init && c.spacing <= 0) {
      std::fprintf(stderr, "line %zu: init needs spacing > 0\n", line_no);
      continue;
    }

    out.push_back(c);
  }

  std::free(line);
  std::fclose(f);
  return true;
}

// -----------------------------
// Replayer impl
// -----------------------------
Replayer::Replayer(Engine& engine, SimMarket& market, BalanceSheet& balances, FillWriter* writer)
  : engine_(engine), market_(market), balances_(balances), writer_(writer) {}

Status Replayer::apply(const Command& c, const Options& opt, int64_t& value) {
  value = 0;
  switch (c.type) {
    case CmdType::Init: {
      const MarketConfig cfg = replay_market_config(c.market, c.spacing);
      if (!market_.create_market(cfg, c.tick, c.amount)) return Status::InvalidOrder;
      value = c.tick;
      // restored from a snapshot: only the venue side is new
      if (engine_.state().market(cfg.id)) return Status::Ok;
      return engine_.initialize_market(cfg);
    }
    case CmdType::Fund: {
      if (c.amount <= 0) return Status::InvalidOrder;
      const MarketConfig cfg = replay_market_config(c.market, 1);
      value = c.amount;
      return balances_.mint(input_asset(cfg, c.dir), c.account, c.amount);
    }
    case CmdType::Place: {
      const PlaceResult r = engine_.place_order(c.account, c.market, c.tick, c.dir, c.amount);
      value = r.tick;
      return r.status;
    }
    case CmdType::Cancel:
      value = c.amount;
      return engine_.cancel_order(c.account, c.market, c.tick, c.dir, c.amount);
    case CmdType::Redeem: {
      const RedeemResult r = engine_.redeem(c.account, c.market, c.tick, c.dir, c.amount);
      value = r.amount_out;
      return r.status;
    }
    case CmdType::Swap: {
      SwapContext ctx;
      if (c.tick > 0) ctx.gas_price = static_cast<uint64_t>(c.tick);
      if (opt.award_points) ctx.points_recipient = c.account;
      const TradeResult r = market_.swap(c.account, c.market, c.dir, c.amount, ctx);
      value = r.amount_out;
      if (r.status == Status::Ok) {
        for (const Fill& fl : engine_.last_cycle().fills) {
          ++totals_.fills;
          if (writer_) {
            writer_->write_fill_row(c.seq, fl.key.market, fl.key.tick, fl.key.dir,
                                    fl.amount_in, fl.amount_out, fl.new_tick);
          }
        }
      }
      return r.status;
    }
  }
  return Status::InvalidOrder;
}

bool Replayer::run(const std::vector<Command>& cmds, const Options& opt) {
  if (cmds.empty()) {
    std::fprintf(stderr, "Replayer: no commands provided.\n");
    return false;
  }

  for (const auto& c : cmds) {
    int64_t value = 0;
    const Status st = apply(c, opt, value);
    if (writer_) writer_->write_result_row(c.seq, to_string(c.type), st, value);

    if (st == Status::Ok) {
      ++totals_.ok;
    } else {
      ++totals_.rejected;
      if (opt.stop_on_error) {
        std::fprintf(stderr, "Replayer: seq %llu (%s) failed: %s\n",
                     (unsigned long long)c.seq, to_string(c.type), to_string(st));
        return false;
      }
    }
  }
  return true;
}

} // namespace tpe
