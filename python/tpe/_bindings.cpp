// python/tpe/_bindings.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <utility>
#include <vector>

#include "tpe/engine.hpp"
#include "tpe/logging.hpp"
#include "tpe/sim_market.hpp"

namespace py = pybind11;
using namespace tpe;

// Engine wired to an in-memory venue, for scripting and notebooks.
struct PySim {
  EngineState  state;
  BalanceSheet balances;
  SimMarket    market;
  Engine       engine;

  explicit PySim(int max_fills)
    : state(),
      balances(EngineOptions{}.self_id),
      market(balances, /*market_account*/ 0x4D),
      engine(state, market, balances, /*logger*/ nullptr, EngineOptions{0x7E, max_fills}) {
    market.set_listener(&engine);
  }

  // Creates the venue side and starts tracking it. Reserves are minted to
  // the market account so swaps can pay out.
  Status init_market(MarketId id, AssetId asset0, AssetId asset1, Tick spacing,
                     Tick initial_tick, Quantity depth, Quantity reserves) {
    const MarketConfig cfg{id, asset0, asset1, spacing};
    if (!market.create_market(cfg, initial_tick, depth)) return Status::InvalidOrder;
    balances.mint(asset0, market.account(), reserves);
    balances.mint(asset1, market.account(), reserves);
    return engine.initialize_market(cfg);
  }

  void     fund(AssetId asset, AccountId who, Quantity amount) { balances.mint(asset, who, amount); }
  Quantity balance(AssetId asset, AccountId who) const { return balances.balance(asset, who); }

  PlaceResult place(AccountId who, MarketId m, Tick tick, Direction dir, Quantity amount) {
    return engine.place_order(who, m, tick, dir, amount);
  }
  Status cancel(AccountId who, MarketId m, Tick tick, Direction dir, Quantity amount) {
    return engine.cancel_order(who, m, tick, dir, amount);
  }
  RedeemResult redeem(AccountId who, MarketId m, Tick tick, Direction dir, Quantity shares) {
    return engine.redeem(who, m, tick, dir, shares);
  }

  // Swap on the venue; returns the trade result plus the fills it triggered.
  py::dict swap(AccountId who, MarketId m, Direction dir, Quantity amount) {
    const TradeResult r = market.swap(who, m, dir, amount);
    py::list fills;
    if (r.status == Status::Ok) {
      for (const Fill& f : engine.last_cycle().fills) {
        py::dict d;
        d["tick"]       = f.key.tick;
        d["dir"]        = f.key.dir;
        d["amount_in"]  = f.amount_in;
        d["amount_out"] = f.amount_out;
        d["new_tick"]   = f.new_tick;
        fills.append(d);
      }
    }
    py::dict d;
    d["status"]     = r.status;
    d["amount_out"] = r.amount_out;
    d["new_tick"]   = r.new_tick;
    d["fills"]      = fills;
    d["deferred"]   = (r.status == Status::Ok) && engine.last_cycle().deferred;
    return d;
  }

  Quantity pending(MarketId m, Tick tick, Direction dir) const { return engine.pending(m, tick, dir); }
  Quantity share_of(AccountId who, MarketId m, Tick tick, Direction dir) const {
    return engine.share_of(who, m, tick, dir);
  }
  Quantity claimable(MarketId m, Tick tick, Direction dir) const { return engine.claimable(m, tick, dir); }
  py::object last_tick(MarketId m) const {
    const auto t = engine.last_tick(m);
    return t ? py::cast(*t) : py::none();
  }
  Tick current_tick(MarketId m) const { return market.current_tick(m); }

  // Top N pending levels for one direction, nearest-to-fill first
  std::vector<std::pair<Tick, Quantity>> depth(MarketId m, Direction dir, int n) const {
    return state.book.levels(m, dir, n);
  }

  std::string position_id(MarketId m, Tick tick, Direction dir) const {
    return engine.position_id(m, tick, dir).hex();
  }

  bool save_snapshot(const std::string& dir, SeqNo seq) const {
    SnapshotWriter w(dir);
    return w.write_snapshot(state, seq);
  }
};

// Expose snapshot load for scripting: (ok, seq, markets, levels)
py::tuple load_snapshot(const std::string& path) {
  EngineState st;
  SeqNo seq = 0;
  bool ok = load_snapshot_file(path, st, seq);
  return py::make_tuple(ok, seq, st.markets.size(), st.book.level_count());
}

PYBIND11_MODULE(_tpe, m) {
  // --- enums ---
  py::enum_<Direction>(m, "Direction")
      .value("ZeroForOne", Direction::ZeroForOne)
      .value("OneForZero", Direction::OneForZero);

  py::enum_<Status>(m, "Status")
      .value("Ok", Status::Ok)
      .value("InvalidOrder", Status::InvalidOrder)
      .value("NothingToClaim", Status::NothingToClaim)
      .value("InsufficientShare", Status::InsufficientShare)
      .value("MarketFailure", Status::MarketFailure)
      .value("TransferFailure", Status::TransferFailure);

  m.attr("MIN_TICK") = py::int_(MIN_TICK);
  m.attr("MAX_TICK") = py::int_(MAX_TICK);

  // --- results ---
  py::class_<PlaceResult>(m, "PlaceResult")
      .def_readonly("status", &PlaceResult::status)
      .def_readonly("tick", &PlaceResult::tick);

  py::class_<RedeemResult>(m, "RedeemResult")
      .def_readonly("status", &RedeemResult::status)
      .def_readonly("amount_out", &RedeemResult::amount_out);

  // --- Sim wrapper ---
  py::class_<PySim>(m, "Sim")
      .def(py::init<int>(), py::arg("max_fills") = 64)
      .def("init_market", &PySim::init_market,
           py::arg("id"), py::arg("asset0"), py::arg("asset1"), py::arg("spacing"),
           py::arg("initial_tick"), py::arg("depth"), py::arg("reserves"))
      .def("fund", &PySim::fund)
      .def("balance", &PySim::balance)
      .def("place", &PySim::place)
      .def("cancel", &PySim::cancel)
      .def("redeem", &PySim::redeem)
      .def("swap", &PySim::swap)
      .def("pending", &PySim::pending)
      .def("share_of", &PySim::share_of)
      .def("claimable", &PySim::claimable)
      .def("last_tick", &PySim::last_tick)
      .def("current_tick", &PySim::current_tick)
      .def("depth", &PySim::depth, py::arg("market"), py::arg("dir"), py::arg("n") = 5)
      .def("position_id", &PySim::position_id)
      .def("save_snapshot", &PySim::save_snapshot);

  // --- helpers ---
  m.def("load_snapshot", &load_snapshot, "Load snapshot and return (ok, seq, markets, levels)");
}
