#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"

namespace nutrition::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  const int applied = executor.AppliedVersion();
  for (int version = applied + 1; version <= static_cast<int>(ordered_sql.size()); ++version) {
    executor.ExecuteSQL(ordered_sql[version - 1]);
    executor.RecordVersion(version);
    NUTRITION_LOG_INFO("applied schema migration", {observability::IntField("version", version)});
  }
}

} // namespace nutrition::db::sql
