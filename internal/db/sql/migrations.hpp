#pragma once

#include <string>
#include <vector>

namespace warranty::db::sql {

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
  (IF NOT EXISTS), so re-running on an initialized database is a no-op.
*/
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Ordered DDL for each backend.
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

} // namespace warranty::db::sql
