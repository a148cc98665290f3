#include "factory.hpp"

#include <memory>
#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if NUTRITION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace nutrition::factory {

using nutrition::observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const nutrition::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if NUTRITION_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path must be set");
    }
    NUTRITION_LOG_INFO("opening sqlite store", {StringField("path", sqlite.path())});
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    db::sqlite::BootstrapSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  NUTRITION_LOG_INFO("using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

core::StoreOptions StoreOptionsFromConfig(const nutrition::runtime::config::RuntimeConfig& config) {
  core::StoreOptions options;
  options.limits.min_amount        = config.scaling().min_amount();
  options.limits.max_direct_amount = config.scaling().max_direct_amount();
  options.sugar_policy             = config.scaling().treat_unknown_sugar_as_added() ? core::AddedSugarPolicy::kTreatAsAdded
                                                                                     : core::AddedSugarPolicy::kLeaveUnknown;
  options.targets.calories = config.targets().calories();
  options.targets.protein  = config.targets().protein();
  options.targets.carbs    = config.targets().carbs();
  options.targets.fat      = config.targets().fat();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const nutrition::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);
  app.store      = std::make_shared<core::NutritionStore>(app.repository, StoreOptionsFromConfig(config));

  // ------------------------------------------------------------------
  // Backup worker
  // ------------------------------------------------------------------
  app.backup_scheduler = std::make_shared<backup::BackupScheduler>();
  app.backup_worker    = std::make_shared<backup::BackupWorker>(app.backup_scheduler);
  app.backup_worker->Start();

  service::BackupServiceOptions backup_options;
  if (!config.backup().directory().empty()) {
    backup_options.directory = config.backup().directory();
  }
  backup_options.filename_prefix = config.backup().filename_prefix();

  app.backup_service = std::make_shared<service::BackupService>(app.store, app.backup_scheduler, backup_options);

  return app;
}

} // namespace nutrition::factory
