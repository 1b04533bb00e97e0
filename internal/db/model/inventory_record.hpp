#pragma once

#include <cstdint>
#include <string>

#include "internal/model/identifier.hpp"

namespace tally::db::model {

using ::tally::model::Identifier;

/*
  Inventory row.

  temp_id keeps the locally minted id after the row is re-keyed to its
  persistent id, so sale line items that still reference the temporary
  id can be resolved.
*/
struct InventoryRecord {
  Identifier  id;
  std::string temp_id;

  std::string user_id;
  std::string store_id;

  std::string name;
  std::string sku;
  std::string category;

  int64_t quantity            = 0;
  double  cost_price          = 0;
  double  selling_price       = 0;
  int64_t minimum_stock_level = 0;
  bool    is_active           = true;

  bool synced     = false;
  bool is_offline = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace tally::db::model
