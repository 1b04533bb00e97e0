#include "remote_store.hpp"

namespace tally::remote {

namespace {

template <typename T>
std::optional<T> GetAs(const Row& row, const std::string& column) {
  auto it = row.find(column);
  if (it == row.end()) return std::nullopt;
  if (const auto* value = std::get_if<T>(&it->second)) return *value;
  return std::nullopt;
}

} // namespace

const char* ToString(RemoteCode code) {
  switch (code) {
    case RemoteCode::OK: return "OK";
    case RemoteCode::NotFound: return "NotFound";
    case RemoteCode::Rejected: return "Rejected";
    case RemoteCode::Unavailable: return "Unavailable";
    case RemoteCode::InternalError: return "InternalError";
  }
  return "Unknown";
}

std::optional<std::string> GetString(const Row& row, const std::string& column) {
  return GetAs<std::string>(row, column);
}

std::optional<int64_t> GetInt(const Row& row, const std::string& column) {
  if (auto value = GetAs<int64_t>(row, column)) return value;
  if (auto value = GetAs<double>(row, column)) return static_cast<int64_t>(*value);
  return std::nullopt;
}

std::optional<double> GetDouble(const Row& row, const std::string& column) {
  if (auto value = GetAs<double>(row, column)) return value;
  if (auto value = GetAs<int64_t>(row, column)) return static_cast<double>(*value);
  return std::nullopt;
}

std::optional<bool> GetBool(const Row& row, const std::string& column) {
  return GetAs<bool>(row, column);
}

} // namespace tally::remote
