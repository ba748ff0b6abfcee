#include <catch2/catch.hpp>
#include <limits>
#include "tpe/claim_ledger.hpp"

using namespace tpe;

namespace {
const PositionId P = make_position_id(1, 60, Direction::ZeroForOne);
constexpr AccountId A = 1, B = 2, C = 3;

Quantity sum_balances(const ClaimLedger& l, const PositionId& p) {
  Quantity s = 0;
  l.for_each_balance([&](const PositionId& q, AccountId, Quantity n){ if (q == p) s += n; });
  return s;
}
} // namespace

TEST_CASE("Redeem pays floor(shares * claimable / supply)") {
  ClaimLedger l;
  l.deposit(P, A, 1000);
  l.credit(P, 500);

  const RedeemQuote q = l.redeem(P, A, 50);
  REQUIRE(q.status == Status::Ok);
  REQUIRE(q.amount_out == 25);
  REQUIRE(l.supply(P) == 950);
  REQUIRE(l.claimable(P) == 475);
  REQUIRE(l.balance_of(P, A) == 950);
}

TEST_CASE("Redeem before any execution is NothingToClaim") {
  ClaimLedger l;
  l.deposit(P, A, 10);
  const RedeemQuote q = l.redeem(P, A, 10);
  REQUIRE(q.status == Status::NothingToClaim);
  REQUIRE(l.balance_of(P, A) == 10);
  REQUIRE(l.redeem(make_position_id(5, 0, Direction::OneForZero), A, 1).status ==
          Status::NothingToClaim);
}

TEST_CASE("Redeem and withdraw beyond the balance are InsufficientShare") {
  ClaimLedger l;
  l.deposit(P, A, 10);
  l.credit(P, 100);
  REQUIRE(l.redeem(P, A, 11).status == Status::InsufficientShare);
  REQUIRE(l.redeem(P, B, 1).status == Status::InsufficientShare);
  REQUIRE(l.withdraw(P, A, 11) == Status::InsufficientShare);
  REQUIRE(l.withdraw(P, A, 0) == Status::InvalidOrder);
  REQUIRE(l.claimable(P) == 100);
  REQUIRE(l.supply(P) == 10);
}

TEST_CASE("Balances always sum to supply") {
  ClaimLedger l;
  l.deposit(P, A, 300);
  l.deposit(P, B, 200);
  l.deposit(P, C, 7);
  REQUIRE(sum_balances(l, P) == l.supply(P));

  REQUIRE(l.withdraw(P, B, 50) == Status::Ok);
  REQUIRE(sum_balances(l, P) == l.supply(P));

  l.credit(P, 1013);
  REQUIRE(l.redeem(P, C, 7).status == Status::Ok);
  REQUIRE(l.redeem(P, A, 100).status == Status::Ok);
  REQUIRE(sum_balances(l, P) == l.supply(P));
  REQUIRE(l.balance_of(P, C) == 0);
}

TEST_CASE("Sequential redemptions never pay out more than was credited") {
  ClaimLedger l;
  l.deposit(P, A, 3);
  l.deposit(P, B, 3);
  l.deposit(P, C, 1);
  l.credit(P, 10);

  Quantity paid = 0;
  for (AccountId who : {C, A, B}) {
    const Quantity shares = l.balance_of(P, who);
    const RedeemQuote q = l.redeem(P, who, shares);
    REQUIRE(q.status == Status::Ok);
    paid += q.amount_out;
  }
  REQUIRE(paid <= 10);
  REQUIRE(l.claimable(P) == 10 - paid);
  REQUIRE(l.supply(P) == 0);
}

TEST_CASE("Last redeemer of a position takes the remainder") {
  ClaimLedger l;
  l.deposit(P, A, 2);
  l.deposit(P, B, 1);
  l.credit(P, 10);

  REQUIRE(l.redeem(P, A, 2).amount_out == 6);   // floor(20/3)
  REQUIRE(l.redeem(P, B, 1).amount_out == 4);   // 1 * 4 / 1
  REQUIRE(l.claimable(P) == 0);
}

TEST_CASE("quote_redeem does not mutate") {
  ClaimLedger l;
  l.deposit(P, A, 4);
  l.credit(P, 9);
  const RedeemQuote q = l.quote_redeem(P, A, 2);
  REQUIRE(q.status == Status::Ok);
  REQUIRE(q.amount_out == 4);
  REQUIRE(l.balance_of(P, A) == 4);
  REQUIRE(l.claimable(P) == 9);
}

TEST_CASE("Deposits and credits that would overflow are rejected") {
  constexpr Quantity kMax = std::numeric_limits<Quantity>::max();
  ClaimLedger l;
  REQUIRE(l.deposit(P, A, 0) == Status::InvalidOrder);
  REQUIRE(l.deposit(P, A, kMax - 5) == Status::Ok);
  REQUIRE_FALSE(l.can_deposit(P, B, 6));
  REQUIRE(l.deposit(P, B, 6) == Status::InvalidOrder);
  REQUIRE(l.deposit(P, B, 5) == Status::Ok);
  REQUIRE(l.supply(P) == kMax);
  REQUIRE(sum_balances(l, P) == l.supply(P));

  REQUIRE(l.credit(P, -1) == Status::InvalidOrder);
  REQUIRE(l.credit(P, 0) == Status::Ok);
  REQUIRE(l.credit(P, kMax) == Status::Ok);
  REQUIRE(l.credit(P, 1) == Status::InvalidOrder);
  REQUIRE(l.claimable(P) == kMax);
}
