#include "backup_service.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/backup/backup_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace nutrition::service {

using nutrition::observability::IntField;
using nutrition::observability::StringField;

namespace {

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::StorageFailure("cannot open backup file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void WriteFile(const std::filesystem::path& path, const std::string& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::StorageFailure("cannot create backup file: " + path.string());
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    throw util::StorageFailure("failed writing backup file: " + path.string());
  }
}

template <typename T, typename Fn>
std::future<T> Schedule(backup::BackupScheduler& scheduler, std::string description, Fn&& fn) {
  auto promise = std::make_shared<std::promise<T>>();
  auto future  = promise->get_future();

  backup::BackupTask task;
  task.description = description;
  task.run         = [promise, fn = std::forward<Fn>(fn)]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  };

  if (!scheduler.Enqueue(std::move(task))) {
    throw std::runtime_error("backup worker is shut down, cannot run " + description);
  }
  return future;
}

} // namespace

BackupService::BackupService(std::shared_ptr<core::NutritionStore> store, std::shared_ptr<backup::BackupScheduler> scheduler,
                             BackupServiceOptions options)
    : store_(std::move(store)), scheduler_(std::move(scheduler)), options_(std::move(options)) {
  if (!store_) {
    throw std::invalid_argument("BackupService requires a store");
  }
  if (!options_.clock) {
    throw std::invalid_argument("BackupService requires a clock");
  }
}

std::string BackupService::Export() {
  return Export(options_.clock());
}

std::string BackupService::Export(util::TimePoint export_date) {
  const auto graph = store_->Snapshot();
  auto       bytes = backup::BackupCodec::Encode(graph, export_date);

  NUTRITION_LOG_INFO("backup exported", {IntField("products", static_cast<std::int64_t>(graph.products.size())),
                                         IntField("daily_logs", static_cast<std::int64_t>(graph.daily_logs.size())),
                                         IntField("food_entries", static_cast<std::int64_t>(graph.food_entries.size())),
                                         IntField("ai_templates", static_cast<std::int64_t>(graph.ai_templates.size())),
                                         IntField("supplements", static_cast<std::int64_t>(graph.supplements.size())),
                                         IntField("supplement_entries", static_cast<std::int64_t>(graph.supplement_entries.size())),
                                         IntField("bytes", static_cast<std::int64_t>(bytes.size()))});
  return bytes;
}

backup::ImportSummary BackupService::Import(std::string_view bytes) {
  try {
    const auto decoded = backup::BackupCodec::Decode(bytes);
    auto       summary = store_->ApplyImport(decoded);

    NUTRITION_LOG_INFO("backup imported",
                       {StringField("summary", summary.Summary()),
                        IntField("imported", static_cast<std::int64_t>(summary.TotalImported())),
                        IntField("skipped", static_cast<std::int64_t>(summary.TotalSkipped())),
                        IntField("dangling_references", static_cast<std::int64_t>(summary.dangling_references))});
    return summary;
  } catch (const std::exception& e) {
    NUTRITION_LOG_ERROR("backup import failed", {StringField("error", e.what())});
    throw;
  }
}

std::filesystem::path BackupService::ExportToFile() {
  std::filesystem::create_directories(options_.directory);
  const auto now  = options_.clock();
  auto       path = options_.directory / ExportFilename(now);
  WriteFile(path, Export(now));
  NUTRITION_LOG_INFO("backup written", {StringField("path", path.string())});
  return path;
}

void BackupService::ExportToFile(const std::filesystem::path& path) {
  WriteFile(path, Export());
  NUTRITION_LOG_INFO("backup written", {StringField("path", path.string())});
}

backup::ImportSummary BackupService::ImportFromFile(const std::filesystem::path& path) {
  NUTRITION_LOG_INFO("importing backup", {StringField("path", path.string())});
  return Import(ReadFile(path));
}

std::future<std::string> BackupService::ExportAsync() {
  if (!scheduler_) throw std::runtime_error("no backup scheduler configured");
  return Schedule<std::string>(*scheduler_, "export", [this] { return Export(); });
}

std::future<backup::ImportSummary> BackupService::ImportAsync(std::string bytes) {
  if (!scheduler_) throw std::runtime_error("no backup scheduler configured");
  return Schedule<backup::ImportSummary>(*scheduler_, "import",
                                         [this, bytes = std::move(bytes)] { return Import(bytes); });
}

std::string BackupService::ExportFilename(util::TimePoint now) const {
  return options_.filename_prefix + util::FormatLocal(now, "%Y-%m-%d_%H%M%S") + ".json";
}

} // namespace nutrition::service
