#pragma once

#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>

#include "internal/backup/backup_scheduler.hpp"
#include "internal/backup/import_summary.hpp"
#include "internal/core/nutrition_store.hpp"
#include "internal/util/time.hpp"

namespace nutrition::service {

struct BackupServiceOptions {
  std::filesystem::path directory = ".";
  std::string           filename_prefix = "CalorieTracker_Backup_";
  // Source of exportDate and of the file name stamp.
  std::function<util::TimePoint()> clock = util::Now;
};

/*
  Export and import of whole-store backups.

  The synchronous calls run on the caller's thread. The *Async variants
  hand the work to the backup worker through the scheduler; the future
  carries either the result or the exception.
*/
class BackupService {
 public:
  BackupService(std::shared_ptr<core::NutritionStore> store, std::shared_ptr<backup::BackupScheduler> scheduler,
                BackupServiceOptions options = {});

  // Export() stamps the document with options.clock(). For a fixed
  // export_date the output depends only on the store contents.
  std::string           Export();
  std::string           Export(util::TimePoint export_date);
  backup::ImportSummary Import(std::string_view bytes);

  // Writes into options.directory under ExportFilename(clock()) and
  // returns the path written. File name and exportDate share one reading.
  std::filesystem::path ExportToFile();
  void                  ExportToFile(const std::filesystem::path& path);
  backup::ImportSummary ImportFromFile(const std::filesystem::path& path);

  std::future<std::string>           ExportAsync();
  std::future<backup::ImportSummary> ImportAsync(std::string bytes);

  // <prefix>yyyy-MM-dd_HHmmss.json
  std::string ExportFilename(util::TimePoint now) const;

 private:
  std::shared_ptr<core::NutritionStore>    store_;
  std::shared_ptr<backup::BackupScheduler> scheduler_;
  BackupServiceOptions                     options_;
};

} // namespace nutrition::service
