#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace vault::db::postgres {

// pqxx::work for writers, pqxx::read_transaction for readers
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return read_only_; }

  bool IsOpen() const { return !finished_; }

private:
  std::shared_ptr<pqxx::connection>       conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool                                    read_only_;
  bool                                    committed_ = false;
  bool                                    finished_  = false;
};

} // namespace vault::db::postgres
