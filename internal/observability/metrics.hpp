#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace tally::runtime::config {
class RuntimeConfig;
}

namespace tally::observability {

// false when metrics are disabled in config or the build has no OTLP support
bool InitializeMetrics(const tally::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Sync engine instruments:

    tally.sync.operations        counter   {table, operation, outcome}
    tally.sync.drain.duration_ms histogram
    tally.sync.queue.depth       gauge     {state = pending | exhausted}

  outcome is "succeeded", "failed" or "exhausted".
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view table, std::string_view operation, std::string_view outcome);
  void ObserveDrainDurationMs(double duration_ms);
  void SetQueueDepth(std::uint64_t pending, std::uint64_t exhausted);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const tally::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, std::string_view, std::string_view) {
}

inline void Metrics::ObserveDrainDurationMs(double) {
}

inline void Metrics::SetQueueDepth(std::uint64_t, std::uint64_t) {
}
#endif

} // namespace tally::observability
