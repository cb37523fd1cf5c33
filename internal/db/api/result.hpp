#pragma once

#include <string>

namespace syncore::db {

/*
  Backend-neutral outcome of a repository write.

  Backends translate their native errors into these codes; components turn a
  failed Result into the exception taxonomy with ThrowIfDbError.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  // the device ran out of space for the local store
  StorageFull,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

/*
  NotFound                               -> util::NotFound
  AlreadyExists, Conflict, Constraint    -> util::InvalidState
  Busy, StorageFull                      -> util::ResourceExhausted
  Corruption                             -> util::CorruptionDetected (key = context)
  anything else                          -> std::runtime_error
*/
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace syncore::db
