#include "file_credential_store.hpp"

#include <fstream>
#include <iterator>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tally::credentials {

namespace fs = std::filesystem;

FileCredentialStore::FileCredentialStore(fs::path directory) : directory_(std::move(directory)) {
}

void FileCredentialStore::Open() {
  std::lock_guard lock(mutex_);
  if (open_) return;

  std::error_code ec;
  fs::create_directories(directory_, ec);
  if (ec) throw std::runtime_error("cannot create credential directory " + directory_.string() + ": " + ec.message());

  fs::permissions(directory_, fs::perms::owner_all, fs::perm_options::replace, ec);
  if (ec) throw std::runtime_error("cannot restrict credential directory " + directory_.string() + ": " + ec.message());

  open_ = true;
  TALLY_LOG_DEBUG("credential store opened", {observability::StringField("directory", directory_.string())});
}

void FileCredentialStore::Set(const std::string& key, const std::string& value) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  RequireOpen();

  const auto target = PathFor(key);
  auto       tmp    = target;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot write credential " + key);
    // restrict before the secret is written
    fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
    if (!out) throw std::runtime_error("cannot write credential " + key);
  }

  std::error_code ec;
  fs::rename(tmp, target, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot store credential " + key);
  }
}

std::optional<std::string> FileCredentialStore::Get(const std::string& key) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  RequireOpen();

  std::ifstream in(PathFor(key), std::ios::binary);
  if (!in) return std::nullopt;
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void FileCredentialStore::Remove(const std::string& key) {
  ValidateKey(key);
  std::lock_guard lock(mutex_);
  RequireOpen();

  std::error_code ec;
  fs::remove(PathFor(key), ec);
  if (ec) throw std::runtime_error("cannot remove credential " + key + ": " + ec.message());
}

fs::path FileCredentialStore::PathFor(const std::string& key) const {
  return directory_ / key;
}

void FileCredentialStore::RequireOpen() const {
  if (!open_) throw util::InvalidState("credential store is not open");
}

} // namespace tally::credentials
