#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace nutrition::db::memory {

/*
  Transaction = snapshot + write set

  Reads go against the snapshot taken at Begin. The first Mutable() call
  marks the transaction as a writer; only writers are checked for
  conflicts at Commit, and only writers publish a new version. A
  read-only transaction commits cleanly however stale its snapshot is.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  MemoryTransaction(const MemoryTransaction&)            = delete;
  MemoryTransaction& operator=(const MemoryTransaction&) = delete;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const;

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen() const;

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  State                   state_            = State::kOpen;
  bool                    dirty_            = false;
};

} // namespace nutrition::db::memory
