#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstdio>
#include <cstdlib>
#include <string_view>

#include "internal/model/nutrient_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace nutrition::db::sqlite {

using nutrition::db::ErrorCode;
using nutrition::db::Result;
using nutrition::model::NutrientCatalog;
using nutrition::model::NutrientMap;
using nutrition::model::NutritionFacts;

namespace {

// ------------------------------------------------------------------
// Column lists (id excluded; it is always column 0 / the last bind)
// ------------------------------------------------------------------

#define FACTS_COLUMNS                                                                                                  \
  "calories,protein,carbohydrates,fat,saturated_fat,trans_fat,fibre,sugar,natural_sugar,added_sugar,sodium,"          \
  "cholesterol,nutrients"

constexpr const char* kProductColumns =
    "name,barcode,brand,emoji,serving_size,serving_size_unit,portion_size,portions_per_package," FACTS_COLUMNS
    ",image_data,main_image_data,notes,is_custom,date_added_ns";

constexpr const char* kDailyLogColumns = "date_ns,calorie_target,protein_target,carb_target,fat_target";

constexpr const char* kFoodEntryColumns =
    "product_id,daily_log_id,product_name,custom_food_name,amount,unit,timestamp_ns," FACTS_COLUMNS
    ",ai_generated,ai_prompt";

constexpr const char* kAiTemplateColumns =
    "name,amount,unit,weight_in_grams," FACTS_COLUMNS ",ai_prompt,date_created_ns,last_used_ns,use_count";

constexpr const char* kSupplementColumns =
    "name,brand,dosage_form,serving_size,serving_size_unit,nutrients,notes,image_data,date_added_ns";

constexpr const char* kSupplementEntryColumns =
    "supplement_id,daily_log_id,supplement_name,amount,unit,timestamp_ns,nutrients";

#undef FACTS_COLUMNS

std::size_t CountColumns(std::string_view cols) {
  std::size_t n = 1;
  for (char c : cols)
    if (c == ',') ++n;
  return n;
}

std::string InsertSql(const char* table, const char* cols) {
  std::string placeholders = "?";
  for (std::size_t i = 0; i < CountColumns(cols); ++i) placeholders += ",?";
  return std::string("INSERT INTO ") + table + "(id," + cols + ") VALUES(" + placeholders + ");";
}

std::string UpdateSql(const char* table, std::string_view cols) {
  std::string sql = std::string("UPDATE ") + table + " SET ";
  std::size_t start = 0;
  while (start <= cols.size()) {
    std::size_t end = cols.find(',', start);
    if (end == std::string_view::npos) end = cols.size();
    if (start > 0) sql += ",";
    sql += cols.substr(start, end - start);
    sql += "=?";
    start = end + 1;
  }
  return sql + " WHERE id=?;";
}

std::string SelectSql(const char* table, const char* cols, const std::string& where = {}) {
  std::string sql = std::string("SELECT id,") + cols + " FROM " + table;
  if (!where.empty()) sql += " WHERE " + where;
  return sql + " ORDER BY id;";
}

// ------------------------------------------------------------------
// Statement + bind/column helpers
// ------------------------------------------------------------------

class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

Result Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptBlob(sqlite3_stmt* st, int idx, const std::optional<std::string>& b) {
  if (b) {
    sqlite3_bind_blob(st, idx, b->data(), static_cast<int>(b->size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

void BindOptDouble(sqlite3_stmt* st, int idx, const std::optional<double>& v) {
  if (v) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<int>& v) {
  if (v) {
    sqlite3_bind_int(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindTime(sqlite3_stmt* st, int idx, util::TimePoint tp) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(util::ToUnixNanos(tp)));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::optional<std::string> ColOptBlob(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size == 0) return std::string();
  return std::string(static_cast<const char*>(data), static_cast<std::size_t>(size));
}

std::optional<double> ColOptDouble(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_double(st, col);
}

std::optional<int> ColOptInt(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int(st, col);
}

util::TimePoint ColTime(sqlite3_stmt* st, int col) {
  return util::FromUnixNanos(sqlite3_column_int64(st, col));
}

// "vitaminA=900;iron=8"
std::string EncodeNutrients(const NutrientMap& nutrients) {
  std::string out;
  char        buf[40];
  for (const auto& [id, value] : nutrients) {
    if (!out.empty()) out += ';';
    out += NutrientCatalog::Key(id);
    std::snprintf(buf, sizeof(buf), "=%.17g", value);
    out += buf;
  }
  return out;
}

NutrientMap DecodeNutrients(const std::string& text) {
  NutrientMap out;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find(';', start);
    if (end == std::string::npos) end = text.size();
    const std::string item = text.substr(start, end - start);
    const auto        eq   = item.find('=');
    if (eq != std::string::npos) {
      if (auto id = NutrientCatalog::Parse(std::string_view(item).substr(0, eq))) {
        out.Set(*id, std::strtod(item.c_str() + eq + 1, nullptr));
      }
    }
    start = end + 1;
  }
  return out;
}

int BindFacts(sqlite3_stmt* st, int idx, const NutritionFacts& facts) {
  ForEachMacro(facts, [&](const char*, const std::optional<double>& field) { BindOptDouble(st, idx++, field); });
  BindText(st, idx++, EncodeNutrients(facts.nutrients));
  return idx;
}

int ReadFacts(sqlite3_stmt* st, int col, NutritionFacts& facts) {
  ForEachMacro(facts, [&](const char*, std::optional<double>& field) { field = ColOptDouble(st, col++); });
  facts.nutrients = DecodeNutrients(ColText(st, col++));
  return col;
}

// ------------------------------------------------------------------
// Per-entity binders / readers. Binders return the next bind index.
// ------------------------------------------------------------------

int BindProduct(sqlite3_stmt* st, int i, const model::ProductRecord& r) {
  BindText(st, i++, r.name);
  BindOptText(st, i++, r.barcode);
  BindOptText(st, i++, r.brand);
  BindOptText(st, i++, r.emoji);
  BindDouble(st, i++, r.serving_size);
  BindText(st, i++, r.serving_size_unit);
  BindOptDouble(st, i++, r.portion_size);
  BindOptInt(st, i++, r.portions_per_package);
  i = BindFacts(st, i, r.per_100g);
  BindOptBlob(st, i++, r.image_data);
  BindOptBlob(st, i++, r.main_image_data);
  BindOptText(st, i++, r.notes);
  sqlite3_bind_int(st, i++, r.is_custom ? 1 : 0);
  BindTime(st, i++, r.date_added);
  return i;
}

model::ProductRecord ReadProduct(sqlite3_stmt* st) {
  model::ProductRecord r;
  int                  c = 0;
  r.id                   = ColText(st, c++);
  r.name                 = ColText(st, c++);
  r.barcode              = ColOptText(st, c++);
  r.brand                = ColOptText(st, c++);
  r.emoji                = ColOptText(st, c++);
  r.serving_size         = sqlite3_column_double(st, c++);
  r.serving_size_unit    = ColText(st, c++);
  r.portion_size         = ColOptDouble(st, c++);
  r.portions_per_package = ColOptInt(st, c++);
  c                      = ReadFacts(st, c, r.per_100g);
  r.image_data           = ColOptBlob(st, c++);
  r.main_image_data      = ColOptBlob(st, c++);
  r.notes                = ColOptText(st, c++);
  r.is_custom            = sqlite3_column_int(st, c++) != 0;
  r.date_added           = ColTime(st, c++);
  return r;
}

int BindDailyLog(sqlite3_stmt* st, int i, const model::DailyLogRecord& r) {
  BindTime(st, i++, r.date);
  BindDouble(st, i++, r.calorie_target);
  BindDouble(st, i++, r.protein_target);
  BindDouble(st, i++, r.carb_target);
  BindDouble(st, i++, r.fat_target);
  return i;
}

model::DailyLogRecord ReadDailyLog(sqlite3_stmt* st) {
  model::DailyLogRecord r;
  r.id             = ColText(st, 0);
  r.date           = ColTime(st, 1);
  r.calorie_target = sqlite3_column_double(st, 2);
  r.protein_target = sqlite3_column_double(st, 3);
  r.carb_target    = sqlite3_column_double(st, 4);
  r.fat_target     = sqlite3_column_double(st, 5);
  return r;
}

int BindFoodEntry(sqlite3_stmt* st, int i, const model::FoodEntryRecord& r) {
  BindOptText(st, i++, r.product_id);
  BindOptText(st, i++, r.daily_log_id);
  BindOptText(st, i++, r.product_name);
  BindOptText(st, i++, r.custom_food_name);
  BindDouble(st, i++, r.amount);
  BindText(st, i++, r.unit);
  BindTime(st, i++, r.timestamp);
  i = BindFacts(st, i, r.snapshot);
  sqlite3_bind_int(st, i++, r.ai_generated ? 1 : 0);
  BindOptText(st, i++, r.ai_prompt);
  return i;
}

model::FoodEntryRecord ReadFoodEntry(sqlite3_stmt* st) {
  model::FoodEntryRecord r;
  int                    c = 0;
  r.id                     = ColText(st, c++);
  r.product_id             = ColOptText(st, c++);
  r.daily_log_id           = ColOptText(st, c++);
  r.product_name           = ColOptText(st, c++);
  r.custom_food_name       = ColOptText(st, c++);
  r.amount                 = sqlite3_column_double(st, c++);
  r.unit                   = ColText(st, c++);
  r.timestamp              = ColTime(st, c++);
  c                        = ReadFacts(st, c, r.snapshot);
  r.ai_generated           = sqlite3_column_int(st, c++) != 0;
  r.ai_prompt              = ColOptText(st, c++);
  return r;
}

int BindAiTemplate(sqlite3_stmt* st, int i, const model::AiTemplateRecord& r) {
  BindText(st, i++, r.name);
  BindDouble(st, i++, r.amount);
  BindText(st, i++, r.unit);
  BindDouble(st, i++, r.weight_in_grams);
  i = BindFacts(st, i, r.snapshot);
  BindOptText(st, i++, r.ai_prompt);
  BindTime(st, i++, r.date_created);
  BindTime(st, i++, r.last_used);
  sqlite3_bind_int(st, i++, r.use_count);
  return i;
}

model::AiTemplateRecord ReadAiTemplate(sqlite3_stmt* st) {
  model::AiTemplateRecord r;
  int                     c = 0;
  r.id                      = ColText(st, c++);
  r.name                    = ColText(st, c++);
  r.amount                  = sqlite3_column_double(st, c++);
  r.unit                    = ColText(st, c++);
  r.weight_in_grams         = sqlite3_column_double(st, c++);
  c                         = ReadFacts(st, c, r.snapshot);
  r.ai_prompt               = ColOptText(st, c++);
  r.date_created            = ColTime(st, c++);
  r.last_used               = ColTime(st, c++);
  r.use_count               = sqlite3_column_int(st, c++);
  return r;
}

int BindSupplement(sqlite3_stmt* st, int i, const model::SupplementRecord& r) {
  BindText(st, i++, r.name);
  BindOptText(st, i++, r.brand);
  BindText(st, i++, r.dosage_form);
  BindDouble(st, i++, r.serving_size);
  BindText(st, i++, r.serving_size_unit);
  BindText(st, i++, EncodeNutrients(r.nutrients));
  BindOptText(st, i++, r.notes);
  BindOptBlob(st, i++, r.image_data);
  BindTime(st, i++, r.date_added);
  return i;
}

model::SupplementRecord ReadSupplement(sqlite3_stmt* st) {
  model::SupplementRecord r;
  r.id                = ColText(st, 0);
  r.name              = ColText(st, 1);
  r.brand             = ColOptText(st, 2);
  r.dosage_form       = ColText(st, 3);
  r.serving_size      = sqlite3_column_double(st, 4);
  r.serving_size_unit = ColText(st, 5);
  r.nutrients         = DecodeNutrients(ColText(st, 6));
  r.notes             = ColOptText(st, 7);
  r.image_data        = ColOptBlob(st, 8);
  r.date_added        = ColTime(st, 9);
  return r;
}

int BindSupplementEntry(sqlite3_stmt* st, int i, const model::SupplementEntryRecord& r) {
  BindOptText(st, i++, r.supplement_id);
  BindOptText(st, i++, r.daily_log_id);
  BindOptText(st, i++, r.supplement_name);
  BindDouble(st, i++, r.amount);
  BindText(st, i++, r.unit);
  BindTime(st, i++, r.timestamp);
  BindText(st, i++, EncodeNutrients(r.nutrients));
  return i;
}

model::SupplementEntryRecord ReadSupplementEntry(sqlite3_stmt* st) {
  model::SupplementEntryRecord r;
  r.id              = ColText(st, 0);
  r.supplement_id   = ColOptText(st, 1);
  r.daily_log_id    = ColOptText(st, 2);
  r.supplement_name = ColOptText(st, 3);
  r.amount          = sqlite3_column_double(st, 4);
  r.unit            = ColText(st, 5);
  r.timestamp       = ColTime(st, 6);
  r.nutrients       = DecodeNutrients(ColText(st, 7));
  return r;
}

// ------------------------------------------------------------------
// Generic execution
// ------------------------------------------------------------------

template <typename Binder>
Result Execute(sqlite3* db, const std::string& sql, Binder&& bind) {
  Statement st(db, sql);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  bind(st.get());
  return Translate(db, sqlite3_step(st.get()));
}

// Execute, then NotFound if no row was touched.
template <typename Binder>
Result ExecuteOnExisting(sqlite3* db, const std::string& sql, const std::string& id, Binder&& bind) {
  auto r = Execute(db, sql, std::forward<Binder>(bind));
  if (r && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return r;
}

// Reads have no Result channel. A failed read throws instead of looking
// like "no rows", which the matchers would take for "no duplicate".
[[noreturn]] void ThrowReadFailure(sqlite3* db, const char* stage, const std::string& sql) {
  const std::string error = sqlite3_errmsg(db);
  NUTRITION_LOG_ERROR("sqlite read failed", {observability::StringField("stage", stage),
                                             observability::StringField("error", error),
                                             observability::StringField("sql", sql)});
  throw util::StorageFailure(std::string("sqlite ") + stage + " failed: " + error);
}

template <typename Reader, typename Binder>
auto QueryAll(sqlite3* db, const std::string& sql, Reader&& read, Binder&& bind) {
  using Record = decltype(read(static_cast<sqlite3_stmt*>(nullptr)));
  std::vector<Record> out;

  Statement st(db, sql);
  if (!st.ok()) ThrowReadFailure(db, "prepare", sql);
  bind(st.get());

  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(read(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowReadFailure(db, "step", sql);
  return out;
}

template <typename Reader, typename Binder>
auto QueryOne(sqlite3* db, const std::string& sql, Reader&& read, Binder&& bind) {
  auto rows = QueryAll(db, sql, std::forward<Reader>(read), std::forward<Binder>(bind));
  using Record = typename decltype(rows)::value_type;
  if (rows.empty()) return std::optional<Record>{};
  return std::optional<Record>{std::move(rows.front())};
}

auto BindId(const std::string& id) {
  return [&id](sqlite3_stmt* st) { BindText(st, 1, id); };
}

auto BindNothing() {
  return [](sqlite3_stmt*) {};
}

auto BindWindow(util::TimePoint from, util::TimePoint to) {
  return [from, to](sqlite3_stmt* st) {
    BindTime(st, 1, from);
    BindTime(st, 2, to);
  };
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result SqliteRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  static const std::string sql = InsertSql("products", kProductColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindProduct(st, 2, r);
  });
}

std::optional<model::ProductRecord> SqliteRepository::GetProduct(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("products", kProductColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadProduct, BindId(id));
}

std::vector<model::ProductRecord> SqliteRepository::ListProducts(Transaction& t) {
  static const std::string sql = SelectSql("products", kProductColumns);
  return QueryAll(TX(t).Handle(), sql, ReadProduct, BindNothing());
}

Result SqliteRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
  static const std::string sql = UpdateSql("products", kProductColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindProduct(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteProduct(Transaction& t, const std::string& id) {
  // food_entries.product_id is ON DELETE SET NULL
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM products WHERE id=?;", id, BindId(id));
}

std::optional<model::ProductRecord> SqliteRepository::FindProductByBarcode(Transaction& t, const std::string& barcode) {
  static const std::string sql = SelectSql("products", kProductColumns, "barcode=?");
  return QueryOne(TX(t).Handle(), sql, ReadProduct, BindId(barcode));
}

std::optional<model::ProductRecord> SqliteRepository::FindProductByNameBrand(Transaction& t, const std::string& name,
                                                                             const std::optional<std::string>& brand) {
  static const std::string sql = SelectSql("products", kProductColumns, "name=? AND brand IS ?");
  return QueryOne(TX(t).Handle(), sql, ReadProduct, [&](sqlite3_stmt* st) {
    BindText(st, 1, name);
    BindOptText(st, 2, brand);
  });
}

// ------------------------------------------------------------------
// Daily logs
// ------------------------------------------------------------------

Result SqliteRepository::InsertDailyLog(Transaction& t, const model::DailyLogRecord& r) {
  static const std::string sql = InsertSql("daily_logs", kDailyLogColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindDailyLog(st, 2, r);
  });
}

std::optional<model::DailyLogRecord> SqliteRepository::GetDailyLog(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("daily_logs", kDailyLogColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadDailyLog, BindId(id));
}

std::vector<model::DailyLogRecord> SqliteRepository::ListDailyLogs(Transaction& t) {
  static const std::string sql = SelectSql("daily_logs", kDailyLogColumns);
  return QueryAll(TX(t).Handle(), sql, ReadDailyLog, BindNothing());
}

Result SqliteRepository::UpdateDailyLog(Transaction& t, const model::DailyLogRecord& r) {
  static const std::string sql = UpdateSql("daily_logs", kDailyLogColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindDailyLog(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteDailyLog(Transaction& t, const std::string& id) {
  // entries cascade through their daily_log_id foreign keys
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM daily_logs WHERE id=?;", id, BindId(id));
}

std::optional<model::DailyLogRecord> SqliteRepository::FindDailyLogInRange(Transaction& t, util::TimePoint from,
                                                                            util::TimePoint to) {
  static const std::string sql = SelectSql("daily_logs", kDailyLogColumns, "date_ns >= ? AND date_ns < ?");
  return QueryOne(TX(t).Handle(), sql, ReadDailyLog, BindWindow(from, to));
}

// ------------------------------------------------------------------
// Food entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertFoodEntry(Transaction& t, const model::FoodEntryRecord& r) {
  static const std::string sql = InsertSql("food_entries", kFoodEntryColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindFoodEntry(st, 2, r);
  });
}

std::optional<model::FoodEntryRecord> SqliteRepository::GetFoodEntry(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("food_entries", kFoodEntryColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadFoodEntry, BindId(id));
}

std::vector<model::FoodEntryRecord> SqliteRepository::ListFoodEntries(Transaction& t) {
  static const std::string sql = SelectSql("food_entries", kFoodEntryColumns);
  return QueryAll(TX(t).Handle(), sql, ReadFoodEntry, BindNothing());
}

std::vector<model::FoodEntryRecord> SqliteRepository::ListFoodEntriesForLog(Transaction& t, const std::string& daily_log_id) {
  static const std::string sql = SelectSql("food_entries", kFoodEntryColumns, "daily_log_id=?");
  return QueryAll(TX(t).Handle(), sql, ReadFoodEntry, BindId(daily_log_id));
}

std::vector<model::FoodEntryRecord> SqliteRepository::ListFoodEntriesBetween(Transaction& t, util::TimePoint from,
                                                                             util::TimePoint to) {
  static const std::string sql = SelectSql("food_entries", kFoodEntryColumns, "timestamp_ns BETWEEN ? AND ?");
  return QueryAll(TX(t).Handle(), sql, ReadFoodEntry, BindWindow(from, to));
}

Result SqliteRepository::UpdateFoodEntry(Transaction& t, const model::FoodEntryRecord& r) {
  static const std::string sql = UpdateSql("food_entries", kFoodEntryColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindFoodEntry(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteFoodEntry(Transaction& t, const std::string& id) {
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM food_entries WHERE id=?;", id, BindId(id));
}

// ------------------------------------------------------------------
// AI templates
// ------------------------------------------------------------------

Result SqliteRepository::InsertAiTemplate(Transaction& t, const model::AiTemplateRecord& r) {
  static const std::string sql = InsertSql("ai_templates", kAiTemplateColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindAiTemplate(st, 2, r);
  });
}

std::optional<model::AiTemplateRecord> SqliteRepository::GetAiTemplate(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("ai_templates", kAiTemplateColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadAiTemplate, BindId(id));
}

std::vector<model::AiTemplateRecord> SqliteRepository::ListAiTemplates(Transaction& t) {
  static const std::string sql = SelectSql("ai_templates", kAiTemplateColumns);
  return QueryAll(TX(t).Handle(), sql, ReadAiTemplate, BindNothing());
}

Result SqliteRepository::UpdateAiTemplate(Transaction& t, const model::AiTemplateRecord& r) {
  static const std::string sql = UpdateSql("ai_templates", kAiTemplateColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindAiTemplate(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteAiTemplate(Transaction& t, const std::string& id) {
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM ai_templates WHERE id=?;", id, BindId(id));
}

std::optional<model::AiTemplateRecord> SqliteRepository::FindAiTemplateByName(Transaction& t, const std::string& name) {
  static const std::string sql = SelectSql("ai_templates", kAiTemplateColumns, "nutrition_fold(name)=nutrition_fold(?)");
  return QueryOne(TX(t).Handle(), sql, ReadAiTemplate, BindId(name));
}

// ------------------------------------------------------------------
// Supplements
// ------------------------------------------------------------------

Result SqliteRepository::InsertSupplement(Transaction& t, const model::SupplementRecord& r) {
  static const std::string sql = InsertSql("supplements", kSupplementColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindSupplement(st, 2, r);
  });
}

std::optional<model::SupplementRecord> SqliteRepository::GetSupplement(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("supplements", kSupplementColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadSupplement, BindId(id));
}

std::vector<model::SupplementRecord> SqliteRepository::ListSupplements(Transaction& t) {
  static const std::string sql = SelectSql("supplements", kSupplementColumns);
  return QueryAll(TX(t).Handle(), sql, ReadSupplement, BindNothing());
}

Result SqliteRepository::UpdateSupplement(Transaction& t, const model::SupplementRecord& r) {
  static const std::string sql = UpdateSql("supplements", kSupplementColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindSupplement(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteSupplement(Transaction& t, const std::string& id) {
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM supplements WHERE id=?;", id, BindId(id));
}

std::optional<model::SupplementRecord> SqliteRepository::FindSupplementByNameBrand(Transaction& t, const std::string& name,
                                                                                   const std::optional<std::string>& brand) {
  static const std::string sql = SelectSql("supplements", kSupplementColumns, "name=? AND brand IS ?");
  return QueryOne(TX(t).Handle(), sql, ReadSupplement, [&](sqlite3_stmt* st) {
    BindText(st, 1, name);
    BindOptText(st, 2, brand);
  });
}

// ------------------------------------------------------------------
// Supplement entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertSupplementEntry(Transaction& t, const model::SupplementEntryRecord& r) {
  static const std::string sql = InsertSql("supplement_entries", kSupplementEntryColumns);
  return Execute(TX(t).Handle(), sql, [&](sqlite3_stmt* st) {
    BindText(st, 1, r.id);
    BindSupplementEntry(st, 2, r);
  });
}

std::optional<model::SupplementEntryRecord> SqliteRepository::GetSupplementEntry(Transaction& t, const std::string& id) {
  static const std::string sql = SelectSql("supplement_entries", kSupplementEntryColumns, "id=?");
  return QueryOne(TX(t).Handle(), sql, ReadSupplementEntry, BindId(id));
}

std::vector<model::SupplementEntryRecord> SqliteRepository::ListSupplementEntries(Transaction& t) {
  static const std::string sql = SelectSql("supplement_entries", kSupplementEntryColumns);
  return QueryAll(TX(t).Handle(), sql, ReadSupplementEntry, BindNothing());
}

std::vector<model::SupplementEntryRecord> SqliteRepository::ListSupplementEntriesForLog(Transaction& t,
                                                                                       const std::string& daily_log_id) {
  static const std::string sql = SelectSql("supplement_entries", kSupplementEntryColumns, "daily_log_id=?");
  return QueryAll(TX(t).Handle(), sql, ReadSupplementEntry, BindId(daily_log_id));
}

std::vector<model::SupplementEntryRecord> SqliteRepository::ListSupplementEntriesBetween(Transaction& t, util::TimePoint from,
                                                                                         util::TimePoint to) {
  static const std::string sql = SelectSql("supplement_entries", kSupplementEntryColumns, "timestamp_ns BETWEEN ? AND ?");
  return QueryAll(TX(t).Handle(), sql, ReadSupplementEntry, BindWindow(from, to));
}

Result SqliteRepository::UpdateSupplementEntry(Transaction& t, const model::SupplementEntryRecord& r) {
  static const std::string sql = UpdateSql("supplement_entries", kSupplementEntryColumns);
  return ExecuteOnExisting(TX(t).Handle(), sql, r.id, [&](sqlite3_stmt* st) {
    const int next = BindSupplementEntry(st, 1, r);
    BindText(st, next, r.id);
  });
}

Result SqliteRepository::DeleteSupplementEntry(Transaction& t, const std::string& id) {
  return ExecuteOnExisting(TX(t).Handle(), "DELETE FROM supplement_entries WHERE id=?;", id, BindId(id));
}

} // namespace nutrition::db::sqlite
