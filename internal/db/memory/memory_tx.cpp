#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

namespace nutrition::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_;
  snapshot_version_ = repo_.committed_version_;
}

MemoryTransaction::~MemoryTransaction() {
  if (state_ == State::kOpen) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  RequireOpen();
  dirty_ = true;
  return working_;
}

const MemoryRepository::State& MemoryTransaction::View() const {
  RequireOpen();
  return working_;
}

void MemoryTransaction::Commit() {
  RequireOpen();
  if (!dirty_) {
    state_ = State::kCommitted;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != snapshot_version_) {
    throw std::runtime_error("transaction conflict: snapshot version " + std::to_string(snapshot_version_) +
                             " is behind committed version " + std::to_string(repo_.committed_version_));
  }
  repo_.committed_ = std::move(working_);
  repo_.committed_version_++;
  state_ = State::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  working_ = {};
  state_   = State::kRolledBack;
}

void MemoryTransaction::RequireOpen() const {
  if (state_ != State::kOpen) throw std::logic_error("transaction already finished");
}

} // namespace nutrition::db::memory
