#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "internal/model/identifier.hpp"

namespace tally::db::model {

using ::tally::model::Identifier;

/*
  Sale line item.

  id is "{sale_id}_item_{index}" so regenerating the items of a sale
  always yields the same keys.
*/
struct SaleItemRecord {
  std::string id;
  std::string sale_id;
  Identifier  inventory_id;
  std::string user_id;

  std::string item_name;
  int64_t     quantity   = 0;
  double      unit_price = 0;
  double      line_total = 0;

  bool synced = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

inline std::string SaleItemId(const std::string& sale_id, std::size_t index) {
  return sale_id + "_item_" + std::to_string(index);
}

} // namespace tally::db::model
