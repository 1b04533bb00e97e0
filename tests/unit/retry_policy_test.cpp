#include "internal/sync/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

namespace {

using std::chrono::milliseconds;
using tally::sync::RetryPolicy;

void TestDefaultScheduleIsCappedAtLastDelay() {
  RetryPolicy policy;
  assert(policy.Schedule().size() == 5);

  assert(policy.DelayFor(0) == milliseconds(1000));
  assert(policy.DelayFor(1) == milliseconds(2000));
  assert(policy.DelayFor(2) == milliseconds(5000));
  assert(policy.DelayFor(3) == milliseconds(10000));
  assert(policy.DelayFor(4) == milliseconds(30000));
  assert(policy.DelayFor(5) == milliseconds(30000));
  assert(policy.DelayFor(1000) == milliseconds(30000));
}

void TestCustomSchedule() {
  RetryPolicy policy(std::vector<milliseconds>{milliseconds(10), milliseconds(20)});
  assert(policy.DelayFor(0) == milliseconds(10));
  assert(policy.DelayFor(1) == milliseconds(20));
  assert(policy.DelayFor(7) == milliseconds(20));
}

void TestEmptyScheduleFallsBackToDefault() {
  RetryPolicy policy(std::vector<milliseconds>{});
  assert(policy.Schedule().size() == 5);
  assert(policy.DelayFor(0) == milliseconds(1000));
}

} // namespace

int main() {
  TestDefaultScheduleIsCappedAtLastDelay();
  TestCustomSchedule();
  TestEmptyScheduleFallsBackToDefault();

  std::cout << "tally_unit_retry_policy: pass\n";
  return 0;
}
