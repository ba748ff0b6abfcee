#include <catch2/catch.hpp>
#include <filesystem>
#include <fstream>
#include "scripted_market.hpp"
#include "tpe/logging.hpp"

using namespace tpe;
using namespace tpe::test;

TEST_CASE("Snapshot roundtrip restores book, shares and claims") {
  std::filesystem::create_directories("test_out");
  SnapshotWriter snap{"test_out"};

  EngineFixture fx;
  fx.balances.mint(10, ALICE, 100);
  fx.balances.mint(10, BOB, 100);
  fx.balances.mint(11, BOB, 100);
  REQUIRE(fx.engine.place_order(ALICE, 1, 20, Direction::ZeroForOne, 30).status == Status::Ok);
  REQUIRE(fx.engine.place_order(BOB, 1, 20, Direction::ZeroForOne, 10).status == Status::Ok);
  REQUIRE(fx.engine.place_order(BOB, 1, 50, Direction::ZeroForOne, 8).status == Status::Ok);
  REQUIRE(fx.engine.place_order(BOB, 1, -40, Direction::OneForZero, 9).status == Status::Ok);

  fx.market.script.push_back({Status::Ok, 80, 27});
  REQUIRE(fx.external_trade(30) == Status::Ok);

  REQUIRE(snap.write_snapshot(fx.state, 77));

  EngineState restored;
  SeqNo seq{};
  REQUIRE(load_snapshot_file(snap.path_for(77), restored, seq));
  REQUIRE(seq == 77);

  const TrackedMarket* m = restored.market(1);
  REQUIRE(m != nullptr);
  REQUIRE(m->cfg.asset0 == 10);
  REQUIRE(m->cfg.asset1 == 11);
  REQUIRE(m->cfg.spacing == 10);
  REQUIRE(m->last_tick == 27);

  REQUIRE(restored.book.level_count() == 2);
  REQUIRE(restored.book.pending(OrderKey{1, 50, Direction::ZeroForOne}) == 8);
  REQUIRE(restored.book.pending(OrderKey{1, -40, Direction::OneForZero}) == 9);

  const PositionId filled = make_position_id(1, 20, Direction::ZeroForOne);
  REQUIRE(restored.ledger.supply(filled) == 40);
  REQUIRE(restored.ledger.balance_of(filled, ALICE) == 30);
  REQUIRE(restored.ledger.claimable(filled) == 80);

  // a fresh engine over the restored state pays out the old claim
  ScriptedMarket market2;
  market2.ticks[1] = 27;
  BalanceSheet balances2{EngineOptions{}.self_id};
  balances2.mint(11, balances2.custody(), 80);
  Engine engine2{restored, market2, balances2};

  const RedeemResult r = engine2.redeem(ALICE, 1, 20, Direction::ZeroForOne, 30);
  REQUIRE(r.status == Status::Ok);
  REQUIRE(r.amount_out == 60);
  REQUIRE(balances2.balance(11, ALICE) == 60);
}

TEST_CASE("Snapshot loader rejects foreign and truncated files") {
  std::filesystem::create_directories("test_out");
  {
    std::ofstream f("test_out/not_a_snapshot.bin", std::ios::binary);
    f << "definitely not a snapshot";
  }
  EngineState st;
  SeqNo seq{};
  REQUIRE_FALSE(load_snapshot_file("test_out/not_a_snapshot.bin", st, seq));
  REQUIRE_FALSE(load_snapshot_file("test_out/does_not_exist.bin", st, seq));

  EngineFixture fx;
  fx.balances.mint(10, ALICE, 5);
  REQUIRE(fx.engine.place_order(ALICE, 1, 20, Direction::ZeroForOne, 5).status == Status::Ok);
  SnapshotWriter snap{"test_out"};
  REQUIRE(snap.write_snapshot(fx.state, 5));

  const auto full = std::filesystem::file_size(snap.path_for(5));
  std::filesystem::resize_file(snap.path_for(5), full - 4);
  EngineState st2;
  REQUIRE_FALSE(load_snapshot_file(snap.path_for(5), st2, seq));
}

TEST_CASE("Logger writes events, fills and periodic snapshots") {
  std::filesystem::create_directories("test_out");
  SnapshotWriter snap{"test_out/periodic"};
  JsonlBinLogger logger{"test_out/run_cycle", /*snapshot_every*/ 2, &snap};

  // init is event 1, the place event 2 -> snapshot at seq 2
  EngineFixture fx{EngineOptions{}, 10, 0, &logger};
  fx.balances.mint(10, ALICE, 5);
  REQUIRE(fx.engine.place_order(ALICE, 1, 20, Direction::ZeroForOne, 5).status == Status::Ok);

  fx.market.script.push_back({Status::Ok, 5, 28});
  REQUIRE(fx.external_trade(30) == Status::Ok);
  logger.flush();

  REQUIRE(logger.event_count() == 3);
  REQUIRE(std::filesystem::file_size(logger.events_bin_path()) == 2 * sizeof(EventBin));
  REQUIRE(std::filesystem::file_size(logger.fills_bin_path()) == sizeof(FillBin));

  std::ifstream fills(logger.fills_bin_path(), std::ios::binary);
  FillBin f{};
  fills.read(reinterpret_cast<char*>(&f), sizeof(f));
  REQUIRE(fills.gcount() == static_cast<std::streamsize>(sizeof(f)));
  // copy out of the packed record before comparing
  const SeqNo seq_logged = f.seq;
  const Tick  tick = f.tick, new_tick = f.new_tick;
  const Quantity amount_in = f.amount_in;
  REQUIRE(seq_logged == 3);
  REQUIRE(tick == 20);
  REQUIRE(amount_in == 5);
  REQUIRE(new_tick == 28);

  EngineState st;
  SeqNo seq{};
  REQUIRE(load_snapshot_file(snap.path_for(2), st, seq));
  REQUIRE(st.book.pending(OrderKey{1, 20, Direction::ZeroForOne}) == 5);
}

TEST_CASE("An aborted cycle is logged") {
  std::filesystem::create_directories("test_out");
  JsonlBinLogger logger{"test_out/run_abort", 0, nullptr};
  EngineFixture fx{EngineOptions{}, 10, 0, &logger};
  fx.balances.mint(10, ALICE, 5);
  REQUIRE(fx.engine.place_order(ALICE, 1, 20, Direction::ZeroForOne, 5).status == Status::Ok);

  fx.market.script.push_back({Status::MarketFailure, 0, 0});
  REQUIRE(fx.external_trade(30) == Status::MarketFailure);
  logger.flush();

  REQUIRE(logger.event_count() == 3);
  std::ifstream ev(logger.events_bin_path(), std::ios::binary);
  EventBin e{};
  for (int i = 0; i < 3; ++i) ev.read(reinterpret_cast<char*>(&e), sizeof(e));
  REQUIRE(ev.gcount() == static_cast<std::streamsize>(sizeof(e)));
  const EventType type = e.type;
  const Quantity  why  = e.out;
  REQUIRE(type == EventType::CycleAbort);
  REQUIRE(why == static_cast<Quantity>(Status::MarketFailure));
  REQUIRE(std::filesystem::file_size(logger.fills_bin_path()) == 0);
}

TEST_CASE("Snapshot keeps a range deferred by the fill bound") {
  std::filesystem::create_directories("test_out");
  SnapshotWriter snap{"test_out/deferred"};

  EngineOptions opt;
  opt.max_fills_per_cycle = 1;
  EngineFixture fx{opt};
  fx.balances.mint(10, ALICE, 100);
  REQUIRE(fx.engine.place_order(ALICE, 1, 10, Direction::ZeroForOne, 5).status == Status::Ok);
  REQUIRE(fx.engine.place_order(ALICE, 1, 20, Direction::ZeroForOne, 7).status == Status::Ok);
  fx.market.script.push_back({Status::Ok, 5, 50});
  REQUIRE(fx.external_trade(50) == Status::Ok);
  REQUIRE(fx.engine.last_cycle().deferred);
  REQUIRE(snap.write_snapshot(fx.state, 9));

  EngineState restored;
  SeqNo seq{};
  REQUIRE(load_snapshot_file(snap.path_for(9), restored, seq));
  const TrackedMarket* m = restored.market(1);
  REQUIRE(m != nullptr);
  REQUIRE(m->last_tick == 0);
  REQUIRE(m->deferred_to == 50);

  // the restored engine still executes the level after the price falls back
  ScriptedMarket market2;
  market2.ticks[1] = -30;
  BalanceSheet balances2{EngineOptions{}.self_id};
  Engine engine2{restored, market2, balances2, nullptr, opt};
  market2.script.push_back({Status::Ok, 7, -30});
  REQUIRE(engine2.on_trade(TradeNotice{1, CAROL, -30}) == Status::Ok);
  REQUIRE(engine2.pending(1, 20, Direction::ZeroForOne) == 0);
  REQUIRE(engine2.last_tick(1) == -30);

  // a snapshot without a deferred range restores none
  EngineFixture plain;
  REQUIRE(snap.write_snapshot(plain.state, 10));
  EngineState restored2;
  REQUIRE(load_snapshot_file(snap.path_for(10), restored2, seq));
  REQUIRE_FALSE(restored2.market(1)->deferred_to.has_value());
}
