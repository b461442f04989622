#pragma once

#include <string>
#include <vector>

namespace vault::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements the executor. Apply() must run all statements
  of one migration and record its version atomically.
*/

struct Migration {
  int                      version = 0;
  std::string              name;
  std::vector<std::string> statements;
};

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  // highest applied version, 0 on a fresh database
  virtual int CurrentVersion() = 0;

  virtual void Apply(const Migration& migration) = 0;
};

const std::vector<Migration>& SqliteMigrations();
const std::vector<Migration>& PostgresMigrations();

// DDL for the version bookkeeping table itself; run before CurrentVersion()
std::string SqliteMigrationTableSql();
std::string PostgresMigrationTableSql();

/*
  Runs migrations newer than CurrentVersion() in order.
  Returns the number applied.
*/
int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace vault::db::sql
