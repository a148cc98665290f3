#include "internal/service/backup_service.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/backup/backup_worker.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using nutrition::backup::BackupScheduler;
using nutrition::backup::BackupWorker;
using nutrition::core::NutritionStore;
using nutrition::db::memory::MemoryRepository;
using nutrition::db::model::ProductRecord;
using nutrition::service::BackupService;
using nutrition::service::BackupServiceOptions;
using nutrition::util::MakeLocalTime;

std::filesystem::path TempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "nutrition_backup_service_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::shared_ptr<NutritionStore> SeededStore() {
  auto store = std::make_shared<NutritionStore>(std::make_shared<MemoryRepository>());

  ProductRecord oats;
  oats.name              = "Oats";
  oats.brand             = "Quaker";
  oats.per_100g.calories = 379;
  oats.per_100g.protein  = 13.2;
  oats                   = store->AddProduct(oats);

  store->LogProduct(oats.id, 40, MakeLocalTime(2026, 1, 15, 7, 30));
  store->LogProduct(oats.id, 60, MakeLocalTime(2026, 1, 16, 7, 30));
  return store;
}

void TestExportFilename() {
  BackupServiceOptions options;
  BackupService        service(SeededStore(), nullptr, options);
  assert(service.ExportFilename(MakeLocalTime(2026, 1, 5, 9, 7, 3)) == "CalorieTracker_Backup_2026-01-05_090703.json");

  options.filename_prefix = "Nutrition_";
  BackupService custom(SeededStore(), nullptr, options);
  assert(custom.ExportFilename(MakeLocalTime(2026, 12, 31, 23, 59, 59)) == "Nutrition_2026-12-31_235959.json");
}

void TestFileRoundTrip() {
  const auto dir = TempDir("file_round_trip");

  BackupServiceOptions options;
  options.directory = dir;
  BackupService source(SeededStore(), nullptr, options);

  const auto path = source.ExportToFile();
  assert(path.parent_path() == dir);
  assert(std::filesystem::exists(path));
  assert(path.filename().string().rfind("CalorieTracker_Backup_", 0) == 0);

  auto          target_store = std::make_shared<NutritionStore>(std::make_shared<MemoryRepository>());
  BackupService target(target_store, nullptr, options);

  auto summary = target.ImportFromFile(path);
  assert(summary.Summary() == "Imported: 1 products, 2 days, 2 entries");

  summary = target.ImportFromFile(path);
  assert(summary.TotalImported() == 0);
  assert(summary.SkippedSummary() == "5 duplicate items skipped");
}

std::string Slurp(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestExportOfUnchangedStoreIsStable() {
  const auto dir   = TempDir("stable_export");
  auto       store = SeededStore();

  // 2026-01-15 09:00:00.250 UTC; the fraction never reaches the document
  const nutrition::util::TimePoint fixed{std::chrono::seconds(1768467600) + std::chrono::milliseconds(250)};

  BackupServiceOptions options;
  options.directory = dir;
  options.clock     = [fixed] { return fixed; };
  BackupService service(store, nullptr, options);

  const auto first = service.Export();
  (void)store->GetDailySummary(MakeLocalTime(2026, 1, 15));
  (void)store->Snapshot();
  const auto second = service.Export();
  assert(first == second);
  assert(first == service.Export(fixed));
  assert(first.find("\"exportDate\": \"2026-01-15T09:00:00Z\"") != std::string::npos);

  const auto path = service.ExportToFile();
  assert(path.filename().string() == service.ExportFilename(fixed));
  assert(Slurp(path) == first);

  // a different export time changes only the stamp
  const auto later = service.Export(fixed + std::chrono::hours(1));
  assert(later != first);
  assert(later.size() == first.size());

  bool threw = false;
  try {
    options.clock = nullptr;
    BackupService no_clock(store, nullptr, options);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestFailedImportChangesNothing() {
  const auto dir   = TempDir("failed_import");
  auto       store = SeededStore();
  BackupService service(store, nullptr);

  const auto before = store->Snapshot();

  bool threw = false;
  try {
    service.Import(R"({"version": 7, "products": []})");
  } catch (const nutrition::util::UnsupportedVersion&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    // first product is fine, second is missing its name
    service.Import(R"({"version": 1, "products": [
      {"id": "0a6c5f7e-3d1b-4c2a-9e8f-1b2c3d4e5f60", "name": "Rice"},
      {"id": "7f1e2d3c-4b5a-4968-8776-a5b4c3d2e1f0"}
    ]})");
  } catch (const nutrition::util::MalformedBackup&) {
    threw = true;
  }
  assert(threw);
  assert(store->ListProducts().size() == 1);

  threw = false;
  try {
    service.ImportFromFile(dir / "does-not-exist.json");
  } catch (const nutrition::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);

  const auto after = store->Snapshot();
  assert(after.products == before.products);
  assert(after.food_entries == before.food_entries);
}

void TestAsyncExportAndImport() {
  auto scheduler = std::make_shared<BackupScheduler>();
  auto worker    = std::make_shared<BackupWorker>(scheduler);
  worker->Start();

  auto          source_store = SeededStore();
  BackupService source(source_store, scheduler);
  auto          exported = source.ExportAsync();

  auto          target_store = std::make_shared<NutritionStore>(std::make_shared<MemoryRepository>());
  BackupService target(target_store, scheduler);

  const auto doc     = exported.get();
  auto       summary = target.ImportAsync(doc).get();
  assert(summary.food_entries.imported == 2);

  // errors travel through the future
  auto failed = target.ImportAsync("{}");
  bool threw  = false;
  try {
    failed.get();
  } catch (const nutrition::util::MalformedBackup&) {
    threw = true;
  }
  assert(threw);

  worker->Stop();

  threw = false;
  try {
    (void)target.ExportAsync();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestWorkerDrainsQueueOnStop() {
  auto scheduler = std::make_shared<BackupScheduler>();
  auto worker    = std::make_shared<BackupWorker>(scheduler);

  int ran = 0;
  for (int i = 0; i < 5; ++i) {
    nutrition::backup::BackupTask task;
    task.description = "count";
    task.run         = [&ran] { ++ran; };
    assert(scheduler->Enqueue(std::move(task)));
  }

  worker->Start();
  worker->Stop();
  assert(ran == 5);

  nutrition::backup::BackupTask late;
  late.run = [&ran] { ++ran; };
  assert(!scheduler->Enqueue(std::move(late)));
}

} // namespace

int main() {
  TestExportFilename();
  TestFileRoundTrip();
  TestExportOfUnchangedStoreIsStable();
  TestFailedImportChangesNothing();
  TestAsyncExportAndImport();
  TestWorkerDrainsQueueOnStop();

  std::cout << "nutrition_unit_backup_service: pass\n";
  return 0;
}
