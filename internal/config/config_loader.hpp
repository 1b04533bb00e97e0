#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace tally::config {

inline constexpr uint32_t kDefaultBatchSize          = 50;
inline constexpr uint32_t kDefaultMaxAttempts        = 3;
inline constexpr uint64_t kDefaultRetryDelaysMs[]    = {1000, 2000, 5000, 10000, 30000};
inline constexpr uint64_t kDefaultPollIntervalMs     = 30000;
inline constexpr uint64_t kDefaultSaleLockWaitMs     = 100;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown fields
  are rejected. Zero values are replaced by the defaults above and an
  unset backend falls back to the in-memory one.
*/
class ConfigLoader {
 public:
  static tally::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(tally::runtime::config::RuntimeConfig& config);

 private:
  static void Validate(const tally::runtime::config::RuntimeConfig& config);
};

} // namespace tally::config
