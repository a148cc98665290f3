#include "sqlite_db.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/util/strings.hpp"

namespace nutrition::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

// nutrition_fold(text) -> case-folded text, NULL stays NULL.
void FoldCaseFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  if (argc != 1 || sqlite3_value_type(argv[0]) == SQLITE_NULL) {
    sqlite3_result_null(ctx);
    return;
  }

  const auto* text = reinterpret_cast<const char*>(sqlite3_value_text(argv[0]));
  const int   size = sqlite3_value_bytes(argv[0]);
  try {
    const auto folded = util::FoldCase(std::string_view(text, static_cast<std::size_t>(size)));
    sqlite3_result_text(ctx, folded.data(), static_cast<int>(folded.size()), SQLITE_TRANSIENT);
  } catch (const std::exception& e) {
    sqlite3_result_error(ctx, e.what(), -1);
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    Close();
    throw std::runtime_error("cannot open nutrition database " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
    RegisterFunctions();
  } catch (const std::exception&) {
    Close();
    throw;
  }
}

SqliteDB::~SqliteDB() {
  Close();
}

void SqliteDB::Close() noexcept {
  if (db_) sqlite3_close(db_);
  db_ = nullptr;
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr), db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure(bool wal_mode) {
  // in-memory databases ignore journal_mode
  if (wal_mode) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");

  // off by default; product/supplement delete nullify and log delete cascade need it
  Exec("PRAGMA foreign_keys=ON;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
}

void SqliteDB::RegisterFunctions() {
  ThrowIf(sqlite3_create_function_v2(db_, "nutrition_fold", 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                     &FoldCaseFunction, nullptr, nullptr, nullptr),
          db_, "register nutrition_fold");
}

} // namespace nutrition::db::sqlite
