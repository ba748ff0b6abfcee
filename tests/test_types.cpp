#include <catch2/catch.hpp>
#include <cstring>
#include "tpe/types.hpp"

using namespace tpe;

TEST_CASE("Basic type properties") {
  STATIC_REQUIRE(std::is_signed_v<Tick>);
  STATIC_REQUIRE(std::is_signed_v<Quantity>);
  STATIC_REQUIRE(sizeof(Direction) == 1);
  STATIC_REQUIRE(MIN_TICK == -887272);
}

TEST_CASE("Direction selects input and output assets") {
  const MarketConfig m{1, 10, 11, 60};
  REQUIRE(input_asset(m, Direction::ZeroForOne) == 10);
  REQUIRE(output_asset(m, Direction::ZeroForOne) == 11);
  REQUIRE(input_asset(m, Direction::OneForZero) == 11);
  REQUIRE(output_asset(m, Direction::OneForZero) == 10);
  REQUIRE(opposite(Direction::ZeroForOne) == Direction::OneForZero);
  REQUIRE(opposite(opposite(Direction::OneForZero)) == Direction::OneForZero);
}

TEST_CASE("Status names") {
  REQUIRE(std::strcmp(to_string(Status::Ok), "ok") == 0);
  REQUIRE(std::strcmp(to_string(Status::NothingToClaim), "nothing_to_claim") == 0);
  REQUIRE(std::strcmp(to_string(Status::TransferFailure), "transfer_failure") == 0);
  REQUIRE(std::strcmp(to_string(Direction::OneForZero), "1for0") == 0);
}
