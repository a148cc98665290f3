#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace nutrition::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  if (db_->InTransaction()) {
    throw std::logic_error("sqlite connection " + db_->Path() + " already has an open transaction");
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ == State::kOpen) RollbackQuietly();
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) throw std::logic_error("transaction already finished");
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    NUTRITION_LOG_ERROR("sqlite commit failed", {observability::StringField("error", e.what())});
    RollbackQuietly();
    throw;
  }
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

void SqliteTransaction::RollbackQuietly() noexcept {
  state_ = State::kRolledBack;
  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (!db_->InTransaction()) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    NUTRITION_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

} // namespace nutrition::db::sqlite
