#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "backup_scheduler.hpp"

namespace nutrition::backup {

/*
  Background worker that runs exports and imports off the caller's thread.

  Stop() drains tasks already queued before joining.
*/
class BackupWorker {
 public:
  explicit BackupWorker(std::shared_ptr<BackupScheduler> scheduler);
  ~BackupWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<BackupScheduler> scheduler_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace nutrition::backup
