#pragma once

#include <optional>
#include <string>

namespace tally::credentials {

/*
  Key/value store for authentication material (session, tokens).

  Keys are restricted to [A-Za-z0-9._-]; other keys are rejected with
  InvalidArgument. Open() must run before any other call.
*/
class CredentialStore {
 public:
  virtual ~CredentialStore() = default;

  virtual void Open() = 0;

  virtual void                       Set(const std::string& key, const std::string& value) = 0;
  virtual std::optional<std::string> Get(const std::string& key)                           = 0;

  // Removing a missing key is not an error.
  virtual void Remove(const std::string& key) = 0;
};

// Throws InvalidArgument for keys outside [A-Za-z0-9._-].
void ValidateKey(const std::string& key);

} // namespace tally::credentials
