#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/backup/entity_graph.hpp"
#include "internal/core/nutrition_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

#if NUTRITION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using nutrition::db::ErrorCode;
using nutrition::db::Repository;
using nutrition::db::memory::MemoryRepository;
using nutrition::db::model::AiTemplateRecord;
using nutrition::db::model::DailyLogRecord;
using nutrition::db::model::FoodEntryRecord;
using nutrition::db::model::ProductRecord;
using nutrition::db::model::SupplementEntryRecord;
using nutrition::db::model::SupplementRecord;
using nutrition::model::NutrientId;
using nutrition::util::MakeLocalTime;
using nutrition::util::NewId;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

ProductRecord MakeProduct(const std::string& name, std::optional<std::string> brand = std::nullopt,
                          std::optional<std::string> barcode = std::nullopt) {
  ProductRecord p;
  p.id                     = NewId();
  p.name                   = name;
  p.brand                  = std::move(brand);
  p.barcode                = std::move(barcode);
  p.per_100g.calories      = 389;
  p.per_100g.protein       = 16.9;
  p.per_100g.carbohydrates = 66.3;
  p.per_100g.fat           = 6.9;
  p.per_100g.nutrients.Set(NutrientId::kIron, 4.7);
  p.date_added = MakeLocalTime(2026, 1, 10, 9, 30);
  return p;
}

DailyLogRecord MakeLog(int day) {
  DailyLogRecord log;
  log.id   = NewId();
  log.date = MakeLocalTime(2026, 1, day);
  return log;
}

FoodEntryRecord MakeEntry(const DailyLogRecord& log, const std::optional<std::string>& product_id, int hour, double calories) {
  FoodEntryRecord e;
  e.id                = NewId();
  e.daily_log_id      = log.id;
  e.product_id        = product_id;
  e.product_name      = "Oats";
  e.amount            = 50;
  e.timestamp         = log.date + std::chrono::hours(hour);
  e.snapshot.calories = calories;
  e.snapshot.protein  = 8.45;
  return e;
}

SupplementRecord MakeSupplement(const std::string& name) {
  SupplementRecord s;
  s.id    = NewId();
  s.name  = name;
  s.brand = "Solgar";
  s.nutrients.Set(NutrientId::kVitaminD, 25);
  s.date_added = MakeLocalTime(2026, 1, 10);
  return s;
}

void VerifyProductCrud(Repository& repo) {
  auto tx = repo.Begin();

  auto product = MakeProduct("Oats", std::string("Quaker"), std::string("5000108030720"));
  product.portion_size         = 40;
  product.portions_per_package = 25;
  product.image_data           = std::string("\x89PNG", 4);
  assert(repo.InsertProduct(*tx, product));

  auto read = repo.GetProduct(*tx, product.id);
  assert(read.has_value());
  assert(*read == product);

  read->name           = "Rolled Oats";
  read->per_100g.fibre = 10.6;
  assert(repo.UpdateProduct(*tx, *read));

  auto updated = repo.GetProduct(*tx, product.id);
  assert(updated.has_value());
  assert(updated->name == "Rolled Oats");
  assert(updated->per_100g.fibre == 10.6);

  assert(repo.DeleteProduct(*tx, product.id));
  assert(!repo.GetProduct(*tx, product.id).has_value());

  tx->Commit();
}

void VerifyLookups(Repository& repo) {
  auto tx = repo.Begin();

  auto branded   = MakeProduct("Milk", std::string("Arla"), std::string("5701211"));
  auto unbranded = MakeProduct("Milk");
  assert(repo.InsertProduct(*tx, branded));
  assert(repo.InsertProduct(*tx, unbranded));

  auto by_barcode = repo.FindProductByBarcode(*tx, "5701211");
  assert(by_barcode.has_value() && by_barcode->id == branded.id);
  assert(!repo.FindProductByBarcode(*tx, "0000000").has_value());

  auto with_brand = repo.FindProductByNameBrand(*tx, "Milk", std::string("Arla"));
  assert(with_brand.has_value() && with_brand->id == branded.id);

  auto without_brand = repo.FindProductByNameBrand(*tx, "Milk", std::nullopt);
  assert(without_brand.has_value() && without_brand->id == unbranded.id);

  assert(!repo.FindProductByNameBrand(*tx, "Milk", std::string("Lurpak")).has_value());

  auto log = MakeLog(15);
  assert(repo.InsertDailyLog(*tx, log));

  const auto day_start = log.date;
  const auto day_end   = nutrition::util::StartOfNextDay(day_start);
  auto       found     = repo.FindDailyLogInRange(*tx, day_start, day_end);
  assert(found.has_value() && found->id == log.id);
  assert(!repo.FindDailyLogInRange(*tx, day_end, day_end + std::chrono::hours(24)).has_value());

  auto entry = MakeEntry(log, branded.id, 8, 188.6);
  assert(repo.InsertFoodEntry(*tx, entry));

  // both window ends are inclusive
  auto exact = repo.ListFoodEntriesBetween(*tx, entry.timestamp, entry.timestamp);
  assert(exact.size() == 1 && exact[0].id == entry.id);
  auto window = repo.ListFoodEntriesBetween(*tx, entry.timestamp - std::chrono::seconds(1), entry.timestamp + std::chrono::seconds(1));
  assert(window.size() == 1);
  assert(repo.ListFoodEntriesBetween(*tx, entry.timestamp + std::chrono::seconds(1), entry.timestamp + std::chrono::seconds(2)).empty());

  AiTemplateRecord tmpl;
  tmpl.id                = NewId();
  tmpl.name              = "Chicken Curry";
  tmpl.amount            = 1;
  tmpl.unit              = "plate";
  tmpl.weight_in_grams   = 350;
  tmpl.snapshot.calories = 620;
  tmpl.date_created      = MakeLocalTime(2026, 1, 12);
  tmpl.last_used         = tmpl.date_created;
  assert(repo.InsertAiTemplate(*tx, tmpl));

  auto by_name = repo.FindAiTemplateByName(*tx, "chicken CURRY");
  assert(by_name.has_value() && by_name->id == tmpl.id);
  assert(!repo.FindAiTemplateByName(*tx, "Chicken Korma").has_value());

  // name match folds non-ASCII letters too
  AiTemplateRecord pastry = tmpl;
  pastry.id               = NewId();
  pastry.name             = "ÉCLAIR AU CAFÉ";
  assert(repo.InsertAiTemplate(*tx, pastry));
  auto folded = repo.FindAiTemplateByName(*tx, "éclair au café");
  assert(folded.has_value() && folded->id == pastry.id);
  assert(!repo.FindAiTemplateByName(*tx, "eclair au cafe").has_value());

  auto supplement = MakeSupplement("Vitamin D3");
  assert(repo.InsertSupplement(*tx, supplement));
  auto by_name_brand = repo.FindSupplementByNameBrand(*tx, "Vitamin D3", std::string("Solgar"));
  assert(by_name_brand.has_value() && by_name_brand->id == supplement.id);
  assert(!repo.FindSupplementByNameBrand(*tx, "Vitamin D3", std::nullopt).has_value());

  tx->Rollback();
}

void VerifyEntriesAndCascades(Repository& repo) {
  auto tx = repo.Begin();

  auto product    = MakeProduct("Oats", std::string("Quaker"));
  auto supplement = MakeSupplement("Magnesium");
  auto log        = MakeLog(16);
  assert(repo.InsertProduct(*tx, product));
  assert(repo.InsertSupplement(*tx, supplement));
  assert(repo.InsertDailyLog(*tx, log));

  auto entry = MakeEntry(log, product.id, 8, 188.6);
  assert(repo.InsertFoodEntry(*tx, entry));

  SupplementEntryRecord dose;
  dose.id              = NewId();
  dose.supplement_id   = supplement.id;
  dose.daily_log_id    = log.id;
  dose.supplement_name = supplement.name;
  dose.amount          = 2;
  dose.timestamp       = log.date + std::chrono::hours(9);
  dose.nutrients       = supplement.nutrients.Scaled(2);
  assert(repo.InsertSupplementEntry(*tx, dose));

  assert(repo.ListFoodEntriesForLog(*tx, log.id).size() == 1);
  assert(repo.ListSupplementEntriesForLog(*tx, log.id).size() == 1);
  assert(repo.ListSupplementEntriesBetween(*tx, dose.timestamp, dose.timestamp).size() == 1);

  auto dose_read = repo.GetSupplementEntry(*tx, dose.id);
  assert(dose_read.has_value() && *dose_read == dose);

  entry.amount            = 100;
  entry.snapshot.calories = 377.2;
  assert(repo.UpdateFoodEntry(*tx, entry));
  assert(repo.GetFoodEntry(*tx, entry.id)->snapshot.calories == 377.2);

  // product delete keeps the entry and its snapshot, only the reference goes
  assert(repo.DeleteProduct(*tx, product.id));
  auto orphan = repo.GetFoodEntry(*tx, entry.id);
  assert(orphan.has_value());
  assert(!orphan->product_id.has_value());
  assert(orphan->product_name == entry.product_name);
  assert(orphan->snapshot == entry.snapshot);

  assert(repo.DeleteSupplement(*tx, supplement.id));
  auto dose_orphan = repo.GetSupplementEntry(*tx, dose.id);
  assert(dose_orphan.has_value() && !dose_orphan->supplement_id.has_value());

  // log delete takes both entry kinds with it
  assert(repo.DeleteDailyLog(*tx, log.id));
  assert(!repo.GetFoodEntry(*tx, entry.id).has_value());
  assert(!repo.GetSupplementEntry(*tx, dose.id).has_value());

  tx->Commit();
}

void VerifyMissingRows(Repository& repo) {
  auto tx = repo.Begin();

  auto ghost = MakeProduct("Ghost");
  auto r     = repo.UpdateProduct(*tx, ghost);
  assert(!r && r.code == ErrorCode::NotFound);

  assert(repo.DeleteProduct(*tx, NewId()).code == ErrorCode::NotFound);
  assert(repo.DeleteDailyLog(*tx, NewId()).code == ErrorCode::NotFound);
  assert(repo.DeleteFoodEntry(*tx, NewId()).code == ErrorCode::NotFound);
  assert(repo.DeleteAiTemplate(*tx, NewId()).code == ErrorCode::NotFound);
  assert(repo.DeleteSupplement(*tx, NewId()).code == ErrorCode::NotFound);
  assert(repo.DeleteSupplementEntry(*tx, NewId()).code == ErrorCode::NotFound);

  tx->Rollback();
}

void VerifyConstraints(Repository& repo) {
  auto tx = repo.Begin();

  auto product = MakeProduct("Bread");
  assert(repo.InsertProduct(*tx, product));

  auto duplicate = repo.InsertProduct(*tx, product);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto log   = MakeLog(17);
  auto entry = MakeEntry(log, product.id, 12, 250);
  // log was never inserted
  auto dangling = repo.InsertFoodEntry(*tx, entry);
  assert(!dangling);
  assert(dangling.code == ErrorCode::ConstraintViolation);

  // a null owner is allowed
  entry.daily_log_id.reset();
  assert(repo.InsertFoodEntry(*tx, entry));

  tx->Rollback();
}

void VerifyOptionalFields(Repository& repo) {
  auto tx = repo.Begin();

  ProductRecord sparse;
  sparse.id                = NewId();
  sparse.name              = "Water";
  sparse.per_100g.calories = 0;
  sparse.per_100g.nutrients.Set(NutrientId::kChloride, 0.0);
  sparse.date_added = MakeLocalTime(2026, 1, 1);
  assert(repo.InsertProduct(*tx, sparse));

  auto read = repo.GetProduct(*tx, sparse.id);
  assert(read.has_value());
  assert(read->per_100g.calories.has_value() && *read->per_100g.calories == 0);
  assert(!read->per_100g.protein.has_value());
  assert(!read->per_100g.sugar.has_value());
  assert(read->per_100g.nutrients.size() == 1);
  assert(read->per_100g.nutrients.Get(NutrientId::kChloride) == 0.0);
  assert(!read->per_100g.nutrients.Contains(NutrientId::kIron));
  assert(!read->brand.has_value());
  assert(!read->barcode.has_value());
  assert(!read->portion_size.has_value());
  assert(!read->image_data.has_value());
  assert(*read == sparse);

  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo) {
  auto product = MakeProduct("Rolled back");
  {
    auto tx = repo.Begin();
    assert(repo.InsertProduct(*tx, product));
    tx->Rollback();
  }

  auto log = MakeLog(20);
  {
    // destructor rolls back an unfinished transaction
    auto tx = repo.Begin();
    assert(repo.InsertDailyLog(*tx, log));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetProduct(*check_tx, product.id).has_value());
  assert(!repo.GetDailyLog(*check_tx, log.id).has_value());
  check_tx->Commit();
}

void VerifyListOrder(Repository& repo) {
  auto tx = repo.Begin();
  for (int i = 0; i < 5; ++i) {
    assert(repo.InsertProduct(*tx, MakeProduct("Product " + std::to_string(i))));
  }
  auto products = repo.ListProducts(*tx);
  for (std::size_t i = 1; i < products.size(); ++i) {
    assert(products[i - 1].id < products[i].id);
  }
  tx->Rollback();
}

void VerifyConcurrentUpdates(Repository& repo, bool supports_parallel_transactions) {
  auto log = MakeLog(21);
  {
    auto tx = repo.Begin();
    assert(repo.InsertDailyLog(*tx, log));
    tx->Commit();
  }

  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::logic_error&) {
      threw = true;
    }
    assert(threw);
    // the refused Begin must not disturb the transaction already open
    assert(repo.GetDailyLog(*tx1, log.id).has_value());
    tx1->Rollback();
    return;
  }

  auto tx2    = repo.Begin();
  auto reader = repo.Begin();
  assert(repo.GetDailyLog(*reader, log.id).has_value());

  auto r1 = repo.GetDailyLog(*tx1, log.id);
  auto r2 = repo.GetDailyLog(*tx2, log.id);
  assert(r1.has_value() && r2.has_value());

  r1->calorie_target = 1800;
  r2->calorie_target = 2200;

  assert(repo.UpdateDailyLog(*tx1, *r1));
  tx1->Commit();

  assert(repo.UpdateDailyLog(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const std::exception&) {
    conflicted = true;
  }
  assert(conflicted);

  // a reader that wrote nothing commits cleanly on a stale snapshot
  reader->Commit();
  assert(reader->IsCommitted());

  auto verify_tx = repo.Begin();
  auto final     = repo.GetDailyLog(*verify_tx, log.id);
  assert(final.has_value());
  assert(final->calorie_target == 1800);
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto product = MakeProduct("Durable", std::string("Brand"), std::string("123"));
  auto log     = MakeLog(22);
  auto entry   = MakeEntry(log, product.id, 13, 120);

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertProduct(*tx, product));
    assert(repo->InsertDailyLog(*tx, log));
    assert(repo->InsertFoodEntry(*tx, entry));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetProduct(*tx, product.id);
  assert(p.has_value() && *p == product);

  auto l = repo->GetDailyLog(*tx, log.id);
  assert(l.has_value() && *l == log);

  auto e = repo->GetFoodEntry(*tx, entry.id);
  assert(e.has_value() && *e == entry);
  tx->Commit();
}

void RunBackendSuite(BackendFactory backend) {
  auto repo = backend.make_repository();

  VerifyProductCrud(*repo);
  VerifyLookups(*repo);
  VerifyEntriesAndCascades(*repo);
  VerifyMissingRows(*repo);
  VerifyConstraints(*repo);
  VerifyOptionalFields(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyListOrder(*repo);
  VerifyConcurrentUpdates(*repo, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend);
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if NUTRITION_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto stamp   = nutrition::util::ToUnixMillis(nutrition::util::Now());
  auto       db_path = (std::filesystem::temp_directory_path() / ("nutrition_integration_sqlite_" + std::to_string(stamp) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<nutrition::db::sqlite::SqliteDB>(db_path);
    nutrition::db::sqlite::BootstrapSchema(db);
    return std::make_shared<nutrition::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart =
          [make_repo](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = make_repo();
          },
      .cleanup =
          [db_path]() {
            std::error_code ec;
            std::filesystem::remove(db_path, ec);
            std::filesystem::remove(db_path + "-wal", ec);
            std::filesystem::remove(db_path + "-shm", ec);
          },
      .supports_parallel_transactions = false,
  };
}

// A read that cannot run must fail loudly; an empty answer would let
// the import matchers treat every incoming row as new.
void VerifySqliteReadFailure() {
  const auto stamp = nutrition::util::ToUnixMillis(nutrition::util::Now());
  const auto db_path =
      (std::filesystem::temp_directory_path() / ("nutrition_integration_sqlite_broken_" + std::to_string(stamp) + ".db")).string();

  auto db = std::make_shared<nutrition::db::sqlite::SqliteDB>(db_path);
  nutrition::db::sqlite::BootstrapSchema(db);
  auto repo = std::make_shared<nutrition::db::sqlite::SqliteRepository>(db);
  db->Exec("DROP TABLE ai_templates;");

  {
    auto tx    = repo->Begin();
    bool threw = false;
    try {
      (void)repo->FindAiTemplateByName(*tx, "Chicken Curry");
    } catch (const nutrition::util::StorageFailure&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      (void)repo->ListAiTemplates(*tx);
    } catch (const nutrition::util::StorageFailure&) {
      threw = true;
    }
    assert(threw);

    // the products table is intact and still answers
    assert(repo->ListProducts(*tx).empty());
  }

  // an import that trips over the broken table applies nothing
  nutrition::core::NutritionStore store(repo);
  nutrition::backup::DecodedGraph decoded;
  decoded.version = 1;
  decoded.graph.products.push_back(MakeProduct("Oats", std::string("Quaker")));

  AiTemplateRecord tmpl;
  tmpl.id                = NewId();
  tmpl.name              = "Chicken Curry";
  tmpl.amount            = 1;
  tmpl.unit              = "plate";
  tmpl.snapshot.calories = 620;
  tmpl.date_created      = MakeLocalTime(2026, 1, 12);
  tmpl.last_used         = tmpl.date_created;
  decoded.graph.ai_templates.push_back(tmpl);

  bool threw = false;
  try {
    (void)store.ApplyImport(decoded);
  } catch (const nutrition::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
  assert(store.ListProducts().empty());

  repo.reset();

  db.reset();
  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  std::filesystem::remove(db_path + "-wal", ec);
  std::filesystem::remove(db_path + "-shm", ec);
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if NUTRITION_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    std::cout << "running backend: " << backend.name << "\n";
    RunBackendSuite(backend);
  }
#if NUTRITION_DB_SQLITE
  VerifySqliteReadFailure();
#endif

  std::cout << "nutrition_integration_repository_parity: pass\n";
  return 0;
}
