#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace rulebook::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("postgres connect: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    RULEBOOK_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw util::TransactionConflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw util::TransactionConflict(std::string("postgres commit: ") + e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("postgres commit: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace rulebook::db::postgres
