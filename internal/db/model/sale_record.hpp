#pragma once

#include <cstdint>
#include <string>

#include "internal/model/identifier.hpp"

namespace tally::db::model {

using ::tally::model::Identifier;

struct SaleRecord {
  Identifier  id;
  std::string temp_id;

  std::string user_id;
  std::string store_id;

  std::string sale_number;
  std::string customer_name;

  // subtotal = sum(line_total); total = subtotal + tax - discount
  double subtotal        = 0;
  double tax_amount      = 0;
  double discount_amount = 0;
  double total_amount    = 0;

  std::string payment_method;
  std::string payment_status;
  uint64_t    sale_date_ms = 0;
  std::string notes;

  bool synced     = false;
  bool is_offline = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace tally::db::model
