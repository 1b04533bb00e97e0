#pragma once

#include <map>
#include <mutex>

#include "credential_store.hpp"

namespace tally::credentials {

class MemoryCredentialStore final : public CredentialStore {
 public:
  void Open() override;

  void                       Set(const std::string& key, const std::string& value) override;
  std::optional<std::string> Get(const std::string& key) override;
  void                       Remove(const std::string& key) override;

 private:
  std::mutex                         mutex_;
  std::map<std::string, std::string> values_;
};

} // namespace tally::credentials
