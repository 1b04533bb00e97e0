#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace tally::sync {

/*
  Fixed retry delay schedule, indexed by attempt count and capped at the
  last entry. Advisory: it tells the caller when to drain next.
*/
class RetryPolicy {
 public:
  RetryPolicy();
  explicit RetryPolicy(std::vector<std::chrono::milliseconds> schedule);

  std::chrono::milliseconds DelayFor(uint32_t attempt) const;

  const std::vector<std::chrono::milliseconds>& Schedule() const {
    return schedule_;
  }

 private:
  std::vector<std::chrono::milliseconds> schedule_;
};

} // namespace tally::sync
