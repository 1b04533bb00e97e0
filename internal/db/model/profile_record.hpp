#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tally::db::model {

enum class Role {
  kIndividual,
  kOwner,
  kWorker,
};

inline const char* RoleName(Role role) {
  switch (role) {
    case Role::kIndividual: return "individual";
    case Role::kOwner: return "owner";
    case Role::kWorker: return "worker";
  }
  return "individual";
}

inline std::optional<Role> ParseRole(const std::string& name) {
  if (name == "individual") return Role::kIndividual;
  if (name == "owner") return Role::kOwner;
  if (name == "worker") return Role::kWorker;
  return std::nullopt;
}

// One row per user; upserted by user_id.
struct ProfileRecord {
  std::string id;
  std::string user_id;
  Role        role = Role::kIndividual;
  std::string store_id;

  std::string business_name;
  std::string email;
  std::string first_name;
  std::string last_name;
  std::string phone;

  bool synced = false;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace tally::db::model
