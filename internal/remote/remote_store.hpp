#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tally::remote {

using Field = std::variant<std::nullptr_t, int64_t, double, bool, std::string>;
using Row   = std::map<std::string, Field>;

// Remote table names.
inline constexpr const char* kInventoryTable = "inventory";
inline constexpr const char* kSalesTable     = "sales";
inline constexpr const char* kSaleItemsTable = "sale_items";
inline constexpr const char* kExpensesTable  = "expenses";
inline constexpr const char* kProfilesTable  = "profiles";

// Column carrying the client-minted id of rows created offline.
inline constexpr const char* kClientRefColumn = "client_ref";

enum class RemoteCode {
  OK,
  NotFound,
  Rejected,    // constraint / permission / validation on the remote side
  Unavailable, // network, timeout
  InternalError,
};

struct RemoteResult {
  RemoteCode  code = RemoteCode::OK;
  std::string message;

  // canonical persisted row; empty for Delete
  Row row;

  static RemoteResult Ok(Row row = {}) {
    return RemoteResult{RemoteCode::OK, {}, std::move(row)};
  }

  static RemoteResult Err(RemoteCode c, std::string msg) {
    return RemoteResult{c, std::move(msg), {}};
  }

  bool ok() const {
    return code == RemoteCode::OK;
  }

  explicit operator bool() const {
    return ok();
  }
};

const char* ToString(RemoteCode code);

// Typed accessors; nullopt when the column is missing or of another type.
std::optional<std::string> GetString(const Row& row, const std::string& column);
std::optional<int64_t>     GetInt(const Row& row, const std::string& column);
std::optional<double>      GetDouble(const Row& row, const std::string& column);
std::optional<bool>        GetBool(const Row& row, const std::string& column);

/*
  Authoritative remote backend, one generic row API per table.

  Every call is atomic for a single row; there are no multi-row
  transactions. Ids of new rows are assigned by the backend and come
  back in row["id"].

  Idempotence:
    - Insert of a row whose client_ref already exists updates and returns
      that row instead of creating a second one
    - InsertMany leaves rows whose id already exists untouched
    - Delete of a missing id succeeds
*/
class RemoteStore {
 public:
  virtual ~RemoteStore() = default;

  virtual RemoteResult Insert(const std::string& table, const Row& row) = 0;

  virtual RemoteResult InsertMany(const std::string& table, const std::vector<Row>& rows) = 0;

  virtual RemoteResult Update(const std::string& table, const std::string& id, const Row& row) = 0;

  virtual RemoteResult Delete(const std::string& table, const std::string& id) = 0;

  // Conflict target is the table's natural key (profiles: user_id, else id).
  virtual RemoteResult Upsert(const std::string& table, const Row& row) = 0;

  virtual RemoteResult Fetch(const std::string& table, const std::string& id) = 0;
};

} // namespace tally::remote
