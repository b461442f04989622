#pragma once

namespace vault::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A read-only transaction rejects writes with ErrorCode::Unsupported

  SQLite: BEGIN IMMEDIATE (writers) / BEGIN DEFERRED (readers)
  Postgres: pqxx::work / pqxx::read_transaction
  Memory: committed snapshot + staged write set, validated at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

} // namespace vault::db
