#pragma once

#include <cstdint>

namespace cadence::gateway {

/// Execution-fee allowance for one outbound call. Once a charge does not fit
/// the meter stays exhausted and the call is treated as failed.
class fee_meter final {
 public:
  explicit fee_meter(const uint64_t budget) : remaining_{budget} {}

  bool charge(const uint64_t units) {
    if (exhausted_ || units > remaining_) {
      exhausted_ = true;
      remaining_ = 0;
      return false;
    }
    remaining_ -= units;
    return true;
  }

  uint64_t remaining() const { return remaining_; }
  bool exhausted() const { return exhausted_; }

 private:
  uint64_t remaining_{};
  bool exhausted_{false};
};

}  // namespace cadence::gateway
