#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace tally::sync {

/*
  Online / offline signal.

  Listeners are called on transitions only, with the new state, on the
  thread that caused the transition.
*/
class ConnectivityMonitor {
 public:
  using Listener = std::function<void(bool online)>;
  using Token    = uint64_t;

  virtual ~ConnectivityMonitor() = default;

  virtual bool IsOnline() const = 0;

  virtual Token Subscribe(Listener listener) = 0;
  virtual void  Unsubscribe(Token token)     = 0;
};

// State is set by the host application (or a test).
class ManualConnectivityMonitor final : public ConnectivityMonitor {
 public:
  explicit ManualConnectivityMonitor(bool online = false);

  void SetOnline(bool online);

  bool  IsOnline() const override;
  Token Subscribe(Listener listener) override;
  void  Unsubscribe(Token token) override;

 private:
  mutable std::mutex        mutex_;
  bool                      online_;
  Token                     next_token_ = 1;
  std::map<Token, Listener> listeners_;
};

} // namespace tally::sync
