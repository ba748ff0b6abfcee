#pragma once
#include "types.hpp"

namespace tpe {

// Round a raw tick down (toward negative infinity) to a multiple of spacing.
//   resolve_level(-100, 60) == -120, resolve_level(100, 60) == 60
inline Tick resolve_level(Tick tick, Tick spacing) {
  Tick intervals = tick / spacing;
  if (tick < 0 && tick % spacing != 0) --intervals;
  return intervals * spacing;
}

// Smallest multiple of spacing that is >= tick.
inline Tick resolve_level_up(Tick tick, Tick spacing) {
  const Tick lo = resolve_level(tick, spacing);
  return (lo == tick) ? lo : lo + spacing;
}

inline bool is_aligned(Tick tick, Tick spacing) {
  return tick % spacing == 0;
}

inline bool in_tick_range(Tick tick) {
  return tick >= MIN_TICK && tick <= MAX_TICK;
}

} // namespace tpe
