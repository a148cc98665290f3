#include "backup_worker.hpp"

#include "internal/observability/logging.hpp"

namespace nutrition::backup {

BackupWorker::BackupWorker(std::shared_ptr<BackupScheduler> scheduler) : scheduler_(std::move(scheduler)) {
}

BackupWorker::~BackupWorker() {
  Stop();
}

void BackupWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&BackupWorker::Run, this);
}

void BackupWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void BackupWorker::Run() {
  // Dequeue returns nullopt only after shutdown with an empty queue.
  while (auto task = scheduler_->Dequeue()) {
    NUTRITION_LOG_DEBUG("backup task started", {observability::StringField("task", task->description)});
    try {
      task->run();
    } catch (const std::exception& e) {
      NUTRITION_LOG_ERROR("backup task failed", {observability::StringField("task", task->description),
                                                 observability::StringField("error", e.what())});
    }
  }
}

} // namespace nutrition::backup
