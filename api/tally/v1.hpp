#pragma once

#include "tally/sync/v1/payload.pb.h"

namespace tally::v1 {
using namespace ::tally::sync::v1;

// Bumped whenever SyncPayload changes incompatibly.
inline constexpr uint32_t kSyncPayloadVersion = 1;
}
