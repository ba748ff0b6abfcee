#pragma once
#include <cstdint>
#include <type_traits>

namespace tpe {

// fixed-precision: prices are integer ticks, amounts integer base units
using Tick      = int64_t;   // discretized price coordinate
using Quantity  = int64_t;   // asset amount in base units
using MarketId  = uint64_t;
using AccountId = uint64_t;
using AssetId   = uint64_t;
using SeqNo     = uint64_t;  // deterministic event ordering

constexpr Tick MIN_TICK = -887272;
constexpr Tick MAX_TICK =  887272;

// Which asset an order sells: ZeroForOne sells asset0 for asset1.
enum class Direction : uint8_t { ZeroForOne = 0, OneForZero = 1 };

enum class Status : uint8_t {
  Ok                = 0,
  InvalidOrder      = 1,
  NothingToClaim    = 2,
  InsufficientShare = 3,
  MarketFailure     = 4,
  TransferFailure   = 5
};

struct MarketConfig {
  MarketId id;
  AssetId  asset0;
  AssetId  asset1;
  Tick     spacing;   // > 0
};

inline Direction opposite(Direction d) {
  return d == Direction::ZeroForOne ? Direction::OneForZero : Direction::ZeroForOne;
}

// asset deposited by an order of direction d
inline AssetId input_asset(const MarketConfig& m, Direction d) {
  return d == Direction::ZeroForOne ? m.asset0 : m.asset1;
}

// asset an order of direction d is converted into
inline AssetId output_asset(const MarketConfig& m, Direction d) {
  return d == Direction::ZeroForOne ? m.asset1 : m.asset0;
}

inline const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                return "ok";
    case Status::InvalidOrder:      return "invalid_order";
    case Status::NothingToClaim:    return "nothing_to_claim";
    case Status::InsufficientShare: return "insufficient_share";
    case Status::MarketFailure:     return "market_failure";
    case Status::TransferFailure:   return "transfer_failure";
  }
  return "unknown";
}

inline const char* to_string(Direction d) {
  return d == Direction::ZeroForOne ? "0for1" : "1for0";
}

// sanity checks that catch mistakes at compile time
static_assert(std::is_signed_v<Tick>);
static_assert(std::is_signed_v<Quantity>);
static_assert(sizeof(Direction) == 1);
static_assert(MIN_TICK == -MAX_TICK);

} // namespace tpe
