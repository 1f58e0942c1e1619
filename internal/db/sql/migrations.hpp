#pragma once

#include <string>
#include <vector>

namespace ledger::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so bootstrap may run on every start.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Schema bootstrap, including the UNIQUE(plan_id, due_date) cycle index.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace ledger::db::sql
