#include <catch2/catch.hpp>
#include <limits>
#include "tpe/order_book.hpp"

using namespace tpe;

TEST_CASE("OrderBook aggregates per (market, level, direction)") {
  OrderBook book;
  const OrderKey k{1, 60, Direction::ZeroForOne};

  REQUIRE(book.add(k, 5) == Status::Ok);
  REQUIRE(book.add(k, 7) == Status::Ok);
  REQUIRE(book.pending(k) == 12);
  REQUIRE(book.pending(OrderKey{1, 60, Direction::OneForZero}) == 0);
  REQUIRE(book.pending(OrderKey{2, 60, Direction::ZeroForOne}) == 0);
  REQUIRE(book.level_count() == 1);
}

TEST_CASE("OrderBook rejects bad amounts and never goes negative") {
  OrderBook book;
  const OrderKey k{1, 0, Direction::OneForZero};

  REQUIRE(book.add(k, 0) == Status::InvalidOrder);
  REQUIRE(book.add(k, -3) == Status::InvalidOrder);
  REQUIRE(book.level_count() == 0);

  REQUIRE(book.add(k, 4) == Status::Ok);
  REQUIRE(book.remove(k, 5) == Status::InvalidOrder);
  REQUIRE(book.pending(k) == 4);

  REQUIRE(book.remove(k, 4) == Status::Ok);
  REQUIRE_FALSE(book.has_level(k));
  REQUIRE(book.level_count() == 0);
}

TEST_CASE("OrderBook rejects aggregate overflow") {
  OrderBook book;
  const OrderKey k{1, 0, Direction::ZeroForOne};
  REQUIRE(book.add(k, std::numeric_limits<Quantity>::max()) == Status::Ok);
  REQUIRE(book.add(k, 1) == Status::InvalidOrder);
  REQUIRE(book.pending(k) == std::numeric_limits<Quantity>::max());
}

TEST_CASE("levels() lists nearest-to-fill first and stops at max_levels") {
  OrderBook book;
  for (Tick t : {30, -10, 10}) {
    REQUIRE(book.add(OrderKey{1, t, Direction::ZeroForOne}, 1) == Status::Ok);
    REQUIRE(book.add(OrderKey{1, t, Direction::OneForZero}, 2) == Status::Ok);
  }
  REQUIRE(book.add(OrderKey{9, 0, Direction::ZeroForOne}, 1) == Status::Ok);

  auto up = book.levels(1, Direction::ZeroForOne, 10);
  REQUIRE(up.size() == 3);
  REQUIRE(up[0].first == -10);
  REQUIRE(up[2].first == 30);

  auto down = book.levels(1, Direction::OneForZero, 2);
  REQUIRE(down.size() == 2);
  REQUIRE(down[0].first == 30);
  REQUIRE(down[1].first == 10);
  REQUIRE(down[0].second == 2);
}

TEST_CASE("set_pending with zero erases the entry") {
  OrderBook book;
  const OrderKey k{1, 20, Direction::ZeroForOne};
  book.set_pending(k, 9);
  REQUIRE(book.pending(k) == 9);
  book.set_pending(k, 0);
  REQUIRE(book.level_count() == 0);

  int visited = 0;
  book.for_each_nonempty([&](const OrderKey&, Quantity){ ++visited; });
  REQUIRE(visited == 0);
}
