#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace nutrition::db::sqlite {

/*
  Owns the single sqlite connection of a nutrition store.

  Opening configures the pragmas every backend guarantee depends on
  (foreign keys for the nullify/cascade rules, a busy timeout) and
  registers the SQL functions the repository queries use:

    nutrition_fold(text)  Unicode case folding, see util::FoldCase
*/
class SqliteDB {
 public:
  // ":memory:" opens a private in-memory database.
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // True while a BEGIN is outstanding on this connection.
  bool InTransaction() const {
    return sqlite3_get_autocommit(db_) == 0;
  }

  // Runs one or more statements; throws std::runtime_error on failure.
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  void Configure(bool wal_mode);
  void RegisterFunctions();
  void Close() noexcept;

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace nutrition::db::sqlite
