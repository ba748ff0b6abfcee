#pragma once
#include <cstdint>

namespace tpe {

// Fees are in pips: 1'000'000 == 100%.
constexpr uint32_t FEE_DENOMINATOR = 1'000'000;

// Swap fee that follows an external cost sample (e.g. gas price):
// cheaper than usual when the sample is high, dearer when it is low.
class MovingAverageFee {
public:
  explicit MovingAverageFee(uint32_t base_fee = 5000) : base_fee_(base_fee) {}

  // fee for a trade observing `sample`
  //   sample > 110% of average -> base / 2
  //   sample <  90% of average -> base * 2
  uint32_t fee_for(uint64_t sample) const;

  // avg = (avg * count + sample) / (count + 1)
  void observe(uint64_t sample);

  uint32_t base_fee() const { return base_fee_; }
  uint64_t average() const { return average_; }
  uint64_t count() const { return count_; }

private:
  uint32_t base_fee_;
  uint64_t average_{0};
  uint64_t count_{0};
};

} // namespace tpe
