#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace tally::util {

/*
  UUID helpers

  Used for server-assigned ids by the in-process remote store.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

} // namespace tally::util
