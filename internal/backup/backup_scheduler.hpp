#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "backup_task.hpp"

namespace nutrition::backup {

/*
  Thread-safe blocking queue for backup workers.
*/
class BackupScheduler {
 public:
  // Returns false once Shutdown() was called; the task is dropped.
  bool Enqueue(BackupTask task);

  // blocking wait
  std::optional<BackupTask> Dequeue();

  void Shutdown();

 private:
  std::mutex             mutex_;
  std::condition_variable cv_;
  std::queue<BackupTask> queue_;
  bool                   shutdown_ = false;
};

} // namespace nutrition::backup
