#pragma once

#include <string>
#include <vector>

namespace nutrition::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL() plus version bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest migration version already applied, 0 for a fresh database.
  virtual int AppliedVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

/*
  Runs migrations in order.
  ordered_sql[i] is migration version i + 1; versions at or below
  AppliedVersion() are skipped.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace nutrition::db::sql
