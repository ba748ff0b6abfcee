#include "tpe/fee_model.hpp"

namespace tpe {

uint32_t MovingAverageFee::fee_for(uint64_t sample) const {
  if (count_ == 0) return base_fee_;
  // compare sample*10 against avg*11 / avg*9 so integer division cannot hide the edge
  const unsigned __int128 s10 = static_cast<unsigned __int128>(sample) * 10;
  const unsigned __int128 avg = average_;
  if (s10 > avg * 11) return base_fee_ / 2;
  if (s10 < avg * 9)  return base_fee_ * 2;
  return base_fee_;
}

void MovingAverageFee::observe(uint64_t sample) {
  const unsigned __int128 total =
      static_cast<unsigned __int128>(average_) * count_ + sample;
  average_ = static_cast<uint64_t>(total / (count_ + 1));
  ++count_;
}

} // namespace tpe
