#pragma once

#include <cstdint>
#include <string>

#include "internal/model/identifier.hpp"

namespace tally::db::model {

using ::tally::model::Identifier;

struct ExpenseRecord {
  Identifier  id;
  std::string temp_id;

  std::string user_id;
  std::string store_id;

  std::string title;
  std::string category;
  std::string description;
  double      amount          = 0;
  uint64_t    expense_date_ms = 0;
  std::string vendor;
  std::string payment_method;
  bool        is_recurring = false;

  bool synced     = false;
  bool is_offline = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace tally::db::model
