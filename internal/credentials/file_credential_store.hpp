#pragma once

#include <filesystem>
#include <mutex>

#include "credential_store.hpp"

namespace tally::credentials {

/*
  One file per key under a private directory.

  Directory mode 0700, files 0600. Writes go to a temporary file that
  is renamed over the target.
*/
class FileCredentialStore final : public CredentialStore {
 public:
  explicit FileCredentialStore(std::filesystem::path directory);

  void Open() override;

  void                       Set(const std::string& key, const std::string& value) override;
  std::optional<std::string> Get(const std::string& key) override;
  void                       Remove(const std::string& key) override;

 private:
  std::filesystem::path PathFor(const std::string& key) const;
  void                  RequireOpen() const;

  std::filesystem::path directory_;
  bool                  open_ = false;
  std::mutex            mutex_;
};

} // namespace tally::credentials
