#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace vault::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) : read_only_(read_only) {
  conn_ = pool->Acquire();
  if (read_only_) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      VAULT_LOG_WARN("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

void PgTransaction::Commit() {
  tx_->commit();
  committed_ = true;
  finished_  = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

} // namespace vault::db::postgres
