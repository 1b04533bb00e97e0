#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "connectivity.hpp"
#include "sync_dispatcher.hpp"

namespace tally::sync {

/*
  Background thread that drains the sync queue.

  Wakes on:
      offline -> online transition
      TriggerNow()
      poll interval, or the dispatcher's retry_after when sooner

  While online it keeps draining as long as full batches come back
  without failures.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<SyncDispatcher> dispatcher, std::shared_ptr<ConnectivityMonitor> connectivity,
             std::chrono::milliseconds poll_interval);
  ~SyncWorker();

  void Start();
  void Stop();

  void TriggerNow();

  // Completed Drain() calls that processed at least one entry.
  uint64_t DrainCount() const {
    return drains_.load();
  }

 private:
  void Run();
  std::chrono::milliseconds DrainWhileOnline();

  std::shared_ptr<SyncDispatcher>      dispatcher_;
  std::shared_ptr<ConnectivityMonitor> connectivity_;
  std::chrono::milliseconds            poll_interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    wake_ = false;

  ConnectivityMonitor::Token subscription_ = 0;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> drains_{0};
};

} // namespace tally::sync
