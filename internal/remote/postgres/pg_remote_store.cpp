#include "pg_remote_store.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace tally::remote::postgres {

namespace {

// pg_type oids
constexpr pqxx::oid kBoolOid    = 16;
constexpr pqxx::oid kInt8Oid    = 20;
constexpr pqxx::oid kInt2Oid    = 21;
constexpr pqxx::oid kInt4Oid    = 23;
constexpr pqxx::oid kFloat4Oid  = 700;
constexpr pqxx::oid kFloat8Oid  = 701;
constexpr pqxx::oid kNumericOid = 1700;

bool KnownTable(const std::string& table) {
  for (const char* known : {kInventoryTable, kSalesTable, kSaleItemsTable, kExpensesTable, kProfilesTable}) {
    if (table == known) return true;
  }
  return false;
}

bool PlainIdentifier(const std::string& name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::islower(static_cast<unsigned char>(c)) || std::isdigit(static_cast<unsigned char>(c)) || c == '_';
  });
}

std::string ConflictColumn(const std::string& table) {
  return table == kProfilesTable ? "user_id" : "id";
}

void Append(pqxx::params& params, const Field& field) {
  std::visit(
      [&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          params.append();
        } else {
          params.append(value);
        }
      },
      field);
}

Row ToRow(const pqxx::row& result) {
  Row row;
  for (const auto& field : result) {
    const std::string column = field.name();
    if (field.is_null()) {
      row[column] = nullptr;
      continue;
    }
    switch (field.type()) {
      case kBoolOid: row[column] = field.as<bool>(); break;
      case kInt2Oid:
      case kInt4Oid:
      case kInt8Oid: row[column] = field.as<int64_t>(); break;
      case kFloat4Oid:
      case kFloat8Oid:
      case kNumericOid: row[column] = field.as<double>(); break;
      default: row[column] = field.as<std::string>(); break;
    }
  }
  return row;
}

// "a, b, c" and "$1, $2, $3" for the row's columns, bound in order.
struct ColumnList {
  std::string  names;
  std::string  placeholders;
  std::string  assignments; // a = EXCLUDED.a, ...
  pqxx::params params;
};

ColumnList BuildColumns(pqxx::work& tx, const Row& row, bool skip_id) {
  ColumnList out;
  int        index = 0;
  for (const auto& [column, value] : row) {
    const auto quoted = tx.quote_name(column);
    if (index > 0) {
      out.names += ", ";
      out.placeholders += ", ";
    }
    out.names += quoted;
    out.placeholders += "$" + std::to_string(++index);
    Append(out.params, value);

    if (skip_id && column == "id") continue;
    if (!out.assignments.empty()) out.assignments += ", ";
    out.assignments += quoted + " = EXCLUDED." + quoted;
  }
  return out;
}

} // namespace

PgRemoteStore::PgRemoteStore(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

template <typename Fn>
RemoteResult PgRemoteStore::Run(const std::string& table, const Row& row, Fn&& fn) {
  if (!KnownTable(table)) return RemoteResult::Err(RemoteCode::Rejected, "unknown table " + table);
  for (const auto& [column, _] : row) {
    if (!PlainIdentifier(column)) return RemoteResult::Err(RemoteCode::Rejected, "invalid column " + column);
  }

  std::shared_ptr<pqxx::connection> conn;
  try {
    conn = pool_->Acquire();
    pqxx::work tx(*conn);
    auto       result = fn(tx);
    tx.commit();
    return result;
  } catch (const pqxx::broken_connection& e) {
    pool_->Discard(conn);
    return RemoteResult::Err(RemoteCode::Unavailable, e.what());
  } catch (const pqxx::sql_error& e) {
    TALLY_LOG_DEBUG("remote statement rejected", {observability::StringField("table", table),
                                                  observability::StringField("sqlstate", e.sqlstate())});
    return RemoteResult::Err(RemoteCode::Rejected, e.what());
  } catch (const std::exception& e) {
    return RemoteResult::Err(RemoteCode::InternalError, e.what());
  }
}

RemoteResult PgRemoteStore::Insert(const std::string& table, const Row& row) {
  return Run(table, row, [&](pqxx::work& tx) {
    auto        cols = BuildColumns(tx, row, true);
    std::string sql  = "INSERT INTO " + tx.quote_name(table) + " (" + cols.names + ") VALUES (" + cols.placeholders + ")";
    auto        ref  = GetString(row, kClientRefColumn);
    if (ref && !ref->empty()) {
      sql += " ON CONFLICT (" + tx.quote_name(kClientRefColumn) + ") DO UPDATE SET " + cols.assignments;
    }
    sql += " RETURNING *";

    auto res = tx.exec_params(sql, cols.params);
    return RemoteResult::Ok(ToRow(res.at(0)));
  });
}

RemoteResult PgRemoteStore::InsertMany(const std::string& table, const std::vector<Row>& rows) {
  Row columns;
  for (const auto& row : rows) {
    for (const auto& [column, _] : row) columns.emplace(column, nullptr);
  }
  return Run(table, columns, [&](pqxx::work& tx) {
    for (const auto& row : rows) {
      auto cols = BuildColumns(tx, row, true);
      tx.exec_params("INSERT INTO " + tx.quote_name(table) + " (" + cols.names + ") VALUES (" + cols.placeholders +
                         ") ON CONFLICT (id) DO NOTHING",
                     cols.params);
    }
    return RemoteResult::Ok();
  });
}

RemoteResult PgRemoteStore::Update(const std::string& table, const std::string& id, const Row& row) {
  return Run(table, row, [&](pqxx::work& tx) {
    std::string  assignments;
    pqxx::params params;
    int          index = 0;
    for (const auto& [column, value] : row) {
      if (column == "id") continue;
      if (!assignments.empty()) assignments += ", ";
      assignments += tx.quote_name(column) + " = $" + std::to_string(++index);
      Append(params, value);
    }
    params.append(id);

    auto res = tx.exec_params("UPDATE " + tx.quote_name(table) + " SET " + assignments + " WHERE id = $" + std::to_string(index + 1) +
                                  " RETURNING *",
                              params);
    if (res.empty()) return RemoteResult::Err(RemoteCode::NotFound, table + " " + id + " not found");
    return RemoteResult::Ok(ToRow(res.at(0)));
  });
}

RemoteResult PgRemoteStore::Delete(const std::string& table, const std::string& id) {
  return Run(table, Row{}, [&](pqxx::work& tx) {
    tx.exec_params("DELETE FROM " + tx.quote_name(table) + " WHERE id = $1", id);
    return RemoteResult::Ok();
  });
}

RemoteResult PgRemoteStore::Upsert(const std::string& table, const Row& row) {
  const auto column = ConflictColumn(table);
  if (!GetString(row, column)) return RemoteResult::Err(RemoteCode::Rejected, "upsert into " + table + " requires " + column);

  return Run(table, row, [&](pqxx::work& tx) {
    auto cols = BuildColumns(tx, row, true);
    auto res  = tx.exec_params("INSERT INTO " + tx.quote_name(table) + " (" + cols.names + ") VALUES (" + cols.placeholders +
                                  ") ON CONFLICT (" + tx.quote_name(column) + ") DO UPDATE SET " + cols.assignments + " RETURNING *",
                              cols.params);
    return RemoteResult::Ok(ToRow(res.at(0)));
  });
}

RemoteResult PgRemoteStore::Fetch(const std::string& table, const std::string& id) {
  return Run(table, Row{}, [&](pqxx::work& tx) {
    auto res = tx.exec_params("SELECT * FROM " + tx.quote_name(table) + " WHERE id = $1", id);
    if (res.empty()) return RemoteResult::Err(RemoteCode::NotFound, table + " " + id + " not found");
    return RemoteResult::Ok(ToRow(res.at(0)));
  });
}

} // namespace tally::remote::postgres
