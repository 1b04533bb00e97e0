#include "memory_credential_store.hpp"

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"

namespace tally::credentials {

void ValidateKey(const std::string& key) {
  const bool valid = !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
  });
  if (!valid || key == "." || key == "..") {
    throw util::InvalidArgument("invalid credential key '" + key + "'");
  }
}

void MemoryCredentialStore::Open() {
}

void MemoryCredentialStore::Set(const std::string& key, const std::string& value) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  values_[key] = value;
}

std::optional<std::string> MemoryCredentialStore::Get(const std::string& key) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  auto            it = values_.find(key);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void MemoryCredentialStore::Remove(const std::string& key) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  values_.erase(key);
}

} // namespace tally::credentials
