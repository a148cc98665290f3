#include "backup_scheduler.hpp"

namespace nutrition::backup {

bool BackupScheduler::Enqueue(BackupTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<BackupTask> BackupScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  BackupTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void BackupScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace nutrition::backup
