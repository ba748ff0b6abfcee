#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include "types.hpp"

namespace tpe {

// Identifier of the position (market, level, direction): SHA-256 over
// be64(market) || be64(tick) || u8(direction). Doubles as the id of the
// fungible claim share depositors hold for that position.
struct PositionId {
  std::array<uint8_t, 32> bytes{};

  bool operator==(const PositionId& o) const { return bytes == o.bytes; }
  bool operator!=(const PositionId& o) const { return bytes != o.bytes; }

  std::string hex() const;
};

struct PositionIdHash {
  std::size_t operator()(const PositionId& p) const noexcept {
    // digest bytes are already uniformly distributed
    std::size_t h;
    std::memcpy(&h, p.bytes.data(), sizeof(h));
    return h;
  }
};

PositionId make_position_id(MarketId market, Tick tick, Direction dir);

} // namespace tpe
