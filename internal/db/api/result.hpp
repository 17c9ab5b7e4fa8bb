#pragma once

#include <string>
#include <string_view>

namespace rulebook::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InvalidArgument,
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
  Raises the util:: exception matching a failed Result:

    NotFound                     -> util::NotFound
    AlreadyExists                -> util::AlreadyExists
    Conflict/Busy/Serialization  -> util::TransactionConflict
    IOError                      -> util::Unavailable
    InvalidArgument              -> util::InvalidArgument
    everything else              -> std::runtime_error
*/
void ThrowIfError(const Result& result, std::string_view context);

} // namespace rulebook::db
