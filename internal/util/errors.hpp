#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace tally::util {

/*
  Central error types.

  Local validation failures surface to the caller immediately.
  The sync dispatcher uses the PermanentError family to decide that an
  entry must not be retried.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientStock : public std::runtime_error {
 public:
  explicit InsufficientStock(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Sale lock contention; the caller retries the user action.
class Busy : public std::runtime_error {
 public:
  explicit Busy(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A temporary reference has no persistent counterpart yet.
class UnresolvedReference : public std::runtime_error {
 public:
  explicit UnresolvedReference(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RemoteError : public std::runtime_error {
 public:
  explicit RemoteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermanentError : public std::runtime_error {
 public:
  explicit PermanentError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedPayload : public PermanentError {
 public:
  explicit MalformedPayload(const std::string& msg) : PermanentError(msg) {
  }
};

class UnroutableOperation : public PermanentError {
 public:
  explicit UnroutableOperation(const std::string& msg) : PermanentError(msg) {
  }
};

// Maps a failed db::Result onto the exception types above.
void ThrowIfDbError(const tally::db::Result& result, const std::string& context);

} // namespace tally::util
