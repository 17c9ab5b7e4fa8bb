#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace rulebook::db {

void ThrowIfError(const Result& result, std::string_view context) {
  if (result) {
    return;
  }

  const auto message = std::string(context) + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw util::TransactionConflict(message);
    case ErrorCode::IOError:
      throw util::Unavailable(message);
    case ErrorCode::InvalidArgument:
      throw util::InvalidArgument(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace rulebook::db
