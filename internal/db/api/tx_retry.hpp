#pragma once

#include <string_view>
#include <type_traits>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::db {

inline constexpr int kMaxConflictAttempts = 8;

/*
  Runs fn(tx) in a fresh transaction and commits it. A
  util::TransactionConflict (raised by fn or by Commit) re-runs the
  whole body, up to kMaxConflictAttempts times, then propagates.

  fn must only touch the database through tx; anything it does outside
  is repeated on every attempt.
*/
template <typename Fn>
auto RunInTransaction(Repository& repository, std::string_view operation, Fn&& fn) {
  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repository.Begin();
      if constexpr (std::is_void_v<decltype(fn(*tx))>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const util::TransactionConflict& e) {
      if (attempt >= kMaxConflictAttempts) {
        throw;
      }
      RULEBOOK_LOG_DEBUG("transaction conflicted, retrying",
                         {observability::StringField("operation", operation), observability::IntField("attempt", attempt),
                          observability::StringField("error", e.what())});
    }
  }
}

} // namespace rulebook::db
