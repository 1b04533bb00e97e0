#include "sync_worker.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"

namespace tally::sync {

SyncWorker::SyncWorker(std::shared_ptr<SyncDispatcher> dispatcher, std::shared_ptr<ConnectivityMonitor> connectivity,
                       std::chrono::milliseconds poll_interval)
    : dispatcher_(std::move(dispatcher)), connectivity_(std::move(connectivity)), poll_interval_(poll_interval) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  if (running_.exchange(true)) return;

  subscription_ = connectivity_->Subscribe([this](bool online) {
    if (online) TriggerNow();
  });
  thread_ = std::thread(&SyncWorker::Run, this);
  TALLY_LOG_INFO("sync worker started", {observability::IntField("poll_interval_ms", poll_interval_.count())});
}

void SyncWorker::Stop() {
  if (!running_.exchange(false)) return;

  connectivity_->Unsubscribe(subscription_);
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  TALLY_LOG_INFO("sync worker stopped");
}

void SyncWorker::TriggerNow() {
  {
    std::lock_guard lock(mutex_);
    wake_ = true;
  }
  cv_.notify_all();
}

void SyncWorker::Run() {
  while (running_) {
    auto wait = poll_interval_;
    if (connectivity_->IsOnline()) wait = std::min(wait, DrainWhileOnline());

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, wait, [this] { return wake_ || !running_; });
    wake_ = false;
  }
}

std::chrono::milliseconds SyncWorker::DrainWhileOnline() {
  auto next = poll_interval_;
  while (running_ && connectivity_->IsOnline()) {
    DrainReport report;
    try {
      report = dispatcher_->Drain();
    } catch (const std::exception& e) {
      TALLY_LOG_ERROR("sync drain failed", {observability::StringField("error", e.what())});
      return next;
    }

    if (report.already_in_progress || report.processed == 0) break;
    ++drains_;

    if (report.retry_after) next = std::min(next, *report.retry_after);

    // a short or failing batch means the queue has nothing ready right now
    if (report.failed > 0 || report.processed < dispatcher_->BatchSize()) break;
  }
  return next;
}

} // namespace tally::sync
