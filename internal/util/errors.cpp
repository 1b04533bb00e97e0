#include "errors.hpp"

namespace tally::util {

void ThrowIfDbError(const tally::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case tally::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case tally::db::ErrorCode::NotFound:
      throw NotFound(message);
    case tally::db::ErrorCode::Conflict:
    case tally::db::ErrorCode::ConstraintViolation:
      throw InvalidState(message);
    case tally::db::ErrorCode::Busy:
      throw Busy(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace tally::util
