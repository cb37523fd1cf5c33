#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace syncore::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    case ErrorCode::Busy:
    case ErrorCode::StorageFull:
      throw util::ResourceExhausted(message);
    case ErrorCode::Corruption:
      throw util::CorruptionDetected(context, message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace syncore::db
