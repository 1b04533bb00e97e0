#pragma once

#include <cstdint>
#include <string>

namespace tally::db::model {

// Dashboard cache entry. value is an opaque JSON document.
struct CacheRecord {
  std::string key;
  std::string value;
  uint64_t    expires_at_ms = 0;
  uint64_t    created_at_ms = 0;
};

} // namespace tally::db::model
