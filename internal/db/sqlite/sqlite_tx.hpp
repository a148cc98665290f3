#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace nutrition::db::sqlite {

/*
  One BEGIN IMMEDIATE ... COMMIT span on the shared connection.

  The write lock is taken at Begin, so a second writer waits on
  busy_timeout instead of failing mid-import. The connection carries a
  single transaction: opening a second one while the first is live
  throws std::logic_error.

  A COMMIT that fails (SQLITE_BUSY, disk full) leaves nothing applied:
  the span is rolled back before the error propagates.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RollbackQuietly() noexcept;

  std::shared_ptr<SqliteDB> db_;
  State state_ = State::kOpen;
};

}
