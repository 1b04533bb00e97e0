#include "retry_policy.hpp"

#include <algorithm>

#include "internal/config/config_loader.hpp"

namespace tally::sync {

namespace {

std::vector<std::chrono::milliseconds> DefaultSchedule() {
  std::vector<std::chrono::milliseconds> schedule;
  for (auto delay : config::kDefaultRetryDelaysMs) schedule.emplace_back(delay);
  return schedule;
}

} // namespace

RetryPolicy::RetryPolicy() : schedule_(DefaultSchedule()) {
}

RetryPolicy::RetryPolicy(std::vector<std::chrono::milliseconds> schedule) : schedule_(std::move(schedule)) {
  if (schedule_.empty()) schedule_ = DefaultSchedule();
}

std::chrono::milliseconds RetryPolicy::DelayFor(uint32_t attempt) const {
  const auto index = std::min<std::size_t>(attempt, schedule_.size() - 1);
  return schedule_[index];
}

} // namespace tally::sync
