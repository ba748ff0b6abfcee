#include "tpe/crossing_scanner.hpp"
#include "tpe/tick_math.hpp"

namespace tpe {

std::optional<Crossing> CrossingScanner::find(MarketId market, Tick spacing,
                                              Tick previous, Tick current) const {
  if (spacing <= 0 || current == previous) return std::nullopt;

  if (current > previous) {
    const Direction dir = Direction::ZeroForOne;
    for (Tick t = resolve_level_up(previous, spacing); t < current; t += spacing) {
      const Quantity q = book_.pending(OrderKey{market, t, dir});
      if (q > 0) return Crossing{t, dir, q};
    }
  } else {
    const Direction dir = Direction::OneForZero;
    for (Tick t = resolve_level(previous, spacing); t > current; t -= spacing) {
      const Quantity q = book_.pending(OrderKey{market, t, dir});
      if (q > 0) return Crossing{t, dir, q};
    }
  }
  return std::nullopt;
}

} // namespace tpe
