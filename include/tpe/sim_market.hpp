#pragma once
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>
#include "types.hpp"
#include "market.hpp"
#include "fee_model.hpp"
#include "points.hpp"

namespace tpe {

// In-memory asset balances. transfer_in/out move funds between an account
// and the custody account (the engine's self id).
class BalanceSheet final : public IAssetTransfer {
public:
  explicit BalanceSheet(AccountId custody) : custody_(custody) {}

  // InvalidOrder if amount <= 0 or the balance would overflow
  Status   mint(AssetId asset, AccountId to, Quantity amount);
  Quantity balance(AssetId asset, AccountId who) const;

  // TransferFailure if `from` holds less than amount or `to` would overflow
  Status move(AssetId asset, AccountId from, AccountId to, Quantity amount);

  Status transfer_in(AssetId asset, AccountId from, Quantity amount) override {
    return move(asset, from, custody_, amount);
  }
  Status transfer_out(AssetId asset, AccountId to, Quantity amount) override {
    return move(asset, custody_, to, amount);
  }

  AccountId custody() const { return custody_; }

  // Savepoints nest. While one is open every balance write is journaled;
  // rollback_to() undoes the writes made since the savepoint and closes it.
  std::size_t begin_savepoint();
  void        release_savepoint(std::size_t sp);
  void        rollback_to(std::size_t sp);

private:
  struct Key {
    AssetId   asset;
    AccountId who;
    bool operator==(const Key& o) const { return asset == o.asset && who == o.who; }
  };
  struct KeyHash {
    std::size_t operator()(const Key& k) const noexcept {
      return static_cast<std::size_t>(k.asset * 0x9E3779B97F4A7C15ull ^ k.who);
    }
  };
  struct JournalEntry {
    Key      key;
    Quantity before;
  };

  void set_balance(const Key& k, Quantity v);
  void close_savepoint();

  AccountId custody_;
  std::unordered_map<Key, Quantity, KeyHash> balances_;
  std::vector<JournalEntry> journal_;
  int open_savepoints_{0};
};

// Optional per-swap inputs for the fee and points mechanisms
struct SwapContext {
  std::optional<uint64_t>  gas_price;
  std::optional<AccountId> points_recipient;
};

// Deterministic stand-in for a real venue. Linear depth: selling `a`
// moves the tick by a / depth (down for ZeroForOne, up for OneForZero);
// output is priced at the mid tick, price(t) = 1.0001^t (asset1 per asset0).
// Every trade is followed by a notice to the listener; a non-Ok answer
// reverts the trade together with everything done while handling it.
class SimMarket final : public IMarket {
public:
  SimMarket(BalanceSheet& balances, AccountId market_account)
    : balances_(balances), account_(market_account) {}

  void set_listener(ITradeListener* l) { listener_ = l; }
  void set_fee_model(MovingAverageFee* f) { fee_ = f; }
  void set_points(PointsLedger* p) { points_ = p; }

  // false if the id exists, depth <= 0 or the tick is out of range
  bool create_market(const MarketConfig& cfg, Tick initial_tick, Quantity depth_per_tick);

  Tick current_tick(MarketId market) const override;

  TradeResult execute_trade(AccountId initiator, MarketId market,
                            Direction dir, Quantity exact_in) override {
    return trade(initiator, market, dir, exact_in, SwapContext{});
  }

  // user entry point
  TradeResult swap(AccountId trader, MarketId market, Direction dir,
                   Quantity exact_in, const SwapContext& ctx = {}) {
    return trade(trader, market, dir, exact_in, ctx);
  }

  AccountId account() const { return account_; }
  const MarketConfig* config(MarketId market) const;

  static double price_at_tick(Tick t);

private:
  struct Pool {
    MarketConfig cfg;
    Tick         tick;
    Quantity     depth;
  };

  TradeResult trade(AccountId initiator, MarketId market, Direction dir,
                    Quantity exact_in, const SwapContext& ctx);

  BalanceSheet&     balances_;
  AccountId         account_;
  ITradeListener*   listener_{nullptr};
  MovingAverageFee* fee_{nullptr};
  PointsLedger*     points_{nullptr};
  std::unordered_map<MarketId, Pool> pools_;
};

} // namespace tpe
