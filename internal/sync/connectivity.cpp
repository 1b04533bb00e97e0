#include "connectivity.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace tally::sync {

ManualConnectivityMonitor::ManualConnectivityMonitor(bool online) : online_(online) {
}

void ManualConnectivityMonitor::SetOnline(bool online) {
  std::vector<Listener> listeners;
  {
    std::lock_guard lock(mutex_);
    if (online_ == online) return;
    online_ = online;
    for (const auto& [_, listener] : listeners_) listeners.push_back(listener);
  }

  TALLY_LOG_INFO(online ? "connectivity restored" : "connectivity lost");
  for (const auto& listener : listeners) listener(online);
}

bool ManualConnectivityMonitor::IsOnline() const {
  std::lock_guard lock(mutex_);
  return online_;
}

ConnectivityMonitor::Token ManualConnectivityMonitor::Subscribe(Listener listener) {
  std::lock_guard lock(mutex_);
  const auto      token = next_token_++;
  listeners_.emplace(token, std::move(listener));
  return token;
}

void ManualConnectivityMonitor::Unsubscribe(Token token) {
  std::lock_guard lock(mutex_);
  listeners_.erase(token);
}

} // namespace tally::sync
