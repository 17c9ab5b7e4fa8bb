#pragma once

#include <stdexcept>
#include <string>

namespace rulebook::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Query and stored embeddings disagree on length. Never recovered by padding.
class DimensionMismatch : public InvalidArgument {
 public:
  explicit DimensionMismatch(const std::string& msg) : InvalidArgument(msg) {
  }
};

// Concurrent writer committed first; the caller may re-run the transaction.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transient infrastructure fault (connection lost, store unreachable).
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedPayload : public std::runtime_error {
 public:
  explicit MalformedPayload(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rulebook::util
