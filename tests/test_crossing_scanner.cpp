#include <catch2/catch.hpp>
#include "tpe/crossing_scanner.hpp"

using namespace tpe;

TEST_CASE("Upward move finds the nearest ZeroForOne level below the new price") {
  OrderBook book;
  REQUIRE(book.add(OrderKey{1, 20, Direction::ZeroForOne}, 5) == Status::Ok);
  REQUIRE(book.add(OrderKey{1, 10, Direction::ZeroForOne}, 3) == Status::Ok);
  REQUIRE(book.add(OrderKey{1, 10, Direction::OneForZero}, 8) == Status::Ok);
  const CrossingScanner scan(book);

  auto hit = scan.find(1, 10, 0, 30);
  REQUIRE(hit.has_value());
  REQUIRE(hit->tick == 10);
  REQUIRE(hit->dir == Direction::ZeroForOne);
  REQUIRE(hit->amount == 3);
}

TEST_CASE("A level exactly at the new price is not crossed") {
  OrderBook book;
  REQUIRE(book.add(OrderKey{1, 30, Direction::ZeroForOne}, 5) == Status::Ok);
  REQUIRE(book.add(OrderKey{1, -30, Direction::OneForZero}, 5) == Status::Ok);
  const CrossingScanner scan(book);
  REQUIRE_FALSE(scan.find(1, 10, 0, 30).has_value());
  REQUIRE_FALSE(scan.find(1, 10, 0, -30).has_value());
  REQUIRE(scan.find(1, 10, 0, 31).has_value());
  REQUIRE(scan.find(1, 10, 0, -31).has_value());
}

TEST_CASE("Downward move finds OneForZero levels only") {
  OrderBook book;
  REQUIRE(book.add(OrderKey{1, -20, Direction::ZeroForOne}, 5) == Status::Ok);
  REQUIRE(book.add(OrderKey{1, -40, Direction::OneForZero}, 6) == Status::Ok);
  const CrossingScanner scan(book);

  auto hit = scan.find(1, 10, 0, -50);
  REQUIRE(hit.has_value());
  REQUIRE(hit->tick == -40);
  REQUIRE(hit->dir == Direction::OneForZero);
}

TEST_CASE("Unaligned start is aligned before scanning") {
  OrderBook book;
  REQUIRE(book.add(OrderKey{1, 0, Direction::ZeroForOne}, 1) == Status::Ok);
  REQUIRE(book.add(OrderKey{1, 0, Direction::OneForZero}, 1) == Status::Ok);
  const CrossingScanner scan(book);

  // 5 -> 25 starts at 10: level 0 lies below the move
  REQUIRE_FALSE(scan.find(1, 10, 5, 25).has_value());
  // 5 -> -25 starts at resolve_level(5) == 0
  auto hit = scan.find(1, 10, 5, -25);
  REQUIRE(hit.has_value());
  REQUIRE(hit->tick == 0);
}

TEST_CASE("No move, other markets and empty books find nothing") {
  OrderBook book;
  REQUIRE(book.add(OrderKey{2, 10, Direction::ZeroForOne}, 1) == Status::Ok);
  const CrossingScanner scan(book);
  REQUIRE_FALSE(scan.find(1, 10, 0, 100).has_value());
  REQUIRE_FALSE(scan.find(2, 10, 50, 50).has_value());
  REQUIRE(scan.find(2, 10, 0, 100).has_value());
}
