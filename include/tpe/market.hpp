#pragma once
#include "types.hpp"

namespace tpe {

struct TradeResult {
  Status   status{Status::Ok};
  Quantity amount_out{0};
  Tick     new_tick{0};
};

// Delivered by the market after every completed trade, including trades
// the engine itself initiated.
struct TradeNotice {
  MarketId  market;
  AccountId initiator;
  Tick      new_tick;
};

// The trading venue. Price discovery and liquidity are its business.
class IMarket {
public:
  virtual ~IMarket() = default;

  virtual Tick current_tick(MarketId market) const = 0;

  // Sell exactly `exact_in` of the direction's input asset. The only point
  // where custody moves between the engine and the market.
  virtual TradeResult execute_trade(AccountId initiator, MarketId market,
                                    Direction dir, Quantity exact_in) = 0;
};

// Trade-completion hook. A non-Ok return obliges the market to revert the
// trade that produced the notice.
class ITradeListener {
public:
  virtual ~ITradeListener() = default;
  virtual Status on_trade(const TradeNotice& notice) = 0;
};

// Custody plumbing between depositors and the engine.
class IAssetTransfer {
public:
  virtual ~IAssetTransfer() = default;
  virtual Status transfer_in (AssetId asset, AccountId from, Quantity amount) = 0;
  virtual Status transfer_out(AssetId asset, AccountId to,   Quantity amount) = 0;
};

} // namespace tpe
