#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/sql/migrations.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::sqlite {

namespace {

#define NUTRITION_FACTS_COLUMNS                                                                                        \
  "calories REAL, protein REAL, carbohydrates REAL, fat REAL, saturated_fat REAL, trans_fat REAL, fibre REAL, "        \
  "sugar REAL, natural_sugar REAL, added_sugar REAL, sodium REAL, cholesterol REAL, nutrients TEXT NOT NULL DEFAULT ''"

const std::vector<std::string>& Migrations() {
  static const std::vector<std::string> kMigrations = {
      // 1: initial schema
      "CREATE TABLE IF NOT EXISTS products ("
      "id TEXT PRIMARY KEY, name TEXT NOT NULL, barcode TEXT, brand TEXT, emoji TEXT, "
      "serving_size REAL NOT NULL, serving_size_unit TEXT NOT NULL, portion_size REAL, portions_per_package INTEGER, "
      NUTRITION_FACTS_COLUMNS ", "
      "image_data BLOB, main_image_data BLOB, notes TEXT, is_custom INTEGER NOT NULL, date_added_ns INTEGER NOT NULL);"

      "CREATE INDEX IF NOT EXISTS products_barcode ON products(barcode);"
      "CREATE INDEX IF NOT EXISTS products_name ON products(name);"

      "CREATE TABLE IF NOT EXISTS daily_logs ("
      "id TEXT PRIMARY KEY, date_ns INTEGER NOT NULL, calorie_target REAL NOT NULL, protein_target REAL NOT NULL, "
      "carb_target REAL NOT NULL, fat_target REAL NOT NULL);"

      "CREATE INDEX IF NOT EXISTS daily_logs_date ON daily_logs(date_ns);"

      "CREATE TABLE IF NOT EXISTS food_entries ("
      "id TEXT PRIMARY KEY, "
      "product_id TEXT REFERENCES products(id) ON DELETE SET NULL, "
      "daily_log_id TEXT REFERENCES daily_logs(id) ON DELETE CASCADE, "
      "product_name TEXT, custom_food_name TEXT, amount REAL NOT NULL, unit TEXT NOT NULL, timestamp_ns INTEGER NOT NULL, "
      NUTRITION_FACTS_COLUMNS ", "
      "ai_generated INTEGER NOT NULL, ai_prompt TEXT);"

      "CREATE INDEX IF NOT EXISTS food_entries_log ON food_entries(daily_log_id);"
      "CREATE INDEX IF NOT EXISTS food_entries_time ON food_entries(timestamp_ns);"

      "CREATE TABLE IF NOT EXISTS ai_templates ("
      "id TEXT PRIMARY KEY, name TEXT NOT NULL, amount REAL NOT NULL, unit TEXT NOT NULL, weight_in_grams REAL NOT NULL, "
      NUTRITION_FACTS_COLUMNS ", "
      "ai_prompt TEXT, date_created_ns INTEGER NOT NULL, last_used_ns INTEGER NOT NULL, use_count INTEGER NOT NULL);"

      "CREATE TABLE IF NOT EXISTS supplements ("
      "id TEXT PRIMARY KEY, name TEXT NOT NULL, brand TEXT, dosage_form TEXT NOT NULL, serving_size REAL NOT NULL, "
      "serving_size_unit TEXT NOT NULL, nutrients TEXT NOT NULL DEFAULT '', notes TEXT, image_data BLOB, "
      "date_added_ns INTEGER NOT NULL);"

      "CREATE TABLE IF NOT EXISTS supplement_entries ("
      "id TEXT PRIMARY KEY, "
      "supplement_id TEXT REFERENCES supplements(id) ON DELETE SET NULL, "
      "daily_log_id TEXT REFERENCES daily_logs(id) ON DELETE CASCADE, "
      "supplement_name TEXT, amount REAL NOT NULL, unit TEXT NOT NULL, timestamp_ns INTEGER NOT NULL, "
      "nutrients TEXT NOT NULL DEFAULT '');"

      "CREATE INDEX IF NOT EXISTS supplement_entries_log ON supplement_entries(daily_log_id);"
      "CREATE INDEX IF NOT EXISTS supplement_entries_time ON supplement_entries(timestamp_ns);",
  };
  return kMigrations;
}

#undef NUTRITION_FACTS_COLUMNS

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int AppliedVersion() override {
    sqlite3_stmt* st = db_.Prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    int           version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
  }

  void RecordVersion(int version) override {
    sqlite3_stmt* st = db_.Prepare("INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    sqlite3_bind_int(st, 1, version);
    sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(util::ToUnixMillis(util::Now())));
    const int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error("recording schema migration failed: " + std::string(sqlite3_errmsg(db_.Handle())));
    }
  }

 private:
  SqliteDB& db_;
};

} // namespace

void BootstrapSchema(const std::shared_ptr<SqliteDB>& db) {
  db->Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  db->Exec("BEGIN IMMEDIATE;");
  try {
    SqliteMigrationExecutor executor(*db);
    sql::RunMigrations(executor, Migrations());
    db->Exec("COMMIT;");
  } catch (const std::exception&) {
    db->Exec("ROLLBACK;");
    throw;
  }

  db->Exec("SELECT id,name,barcode,brand FROM products LIMIT 1;");
  db->Exec("SELECT id,date_ns FROM daily_logs LIMIT 1;");
  db->Exec("SELECT id,product_id,daily_log_id FROM food_entries LIMIT 1;");
  db->Exec("SELECT id,name,use_count FROM ai_templates LIMIT 1;");
  db->Exec("SELECT id,name,brand FROM supplements LIMIT 1;");
  db->Exec("SELECT id,supplement_id,daily_log_id FROM supplement_entries LIMIT 1;");
}

} // namespace nutrition::db::sqlite
