#include "internal/core/nutrition_store.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/backup/backup_codec.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using nutrition::core::AddedSugarPolicy;
using nutrition::core::NutritionStore;
using nutrition::core::StoreOptions;
using nutrition::db::memory::MemoryRepository;
using nutrition::db::model::ProductRecord;
using nutrition::db::model::SupplementRecord;
using nutrition::model::NutrientId;
using nutrition::util::MakeLocalTime;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::fabs(b));
}

bool Near(const std::optional<double>& a, double b) {
  return a.has_value() && Near(*a, b);
}

std::unique_ptr<NutritionStore> MakeStore(StoreOptions options = {}) {
  return std::make_unique<NutritionStore>(std::make_shared<MemoryRepository>(), options);
}

ProductRecord Yoghurt() {
  ProductRecord p;
  p.name                 = "Greek style yoghurt";
  p.brand                = "Fage";
  p.portion_size         = 115;
  p.portions_per_package = 4;
  p.per_100g.calories    = 82;
  p.per_100g.protein     = 4.5;
  p.per_100g.sugar       = 3.2;
  p.per_100g.nutrients.Set(NutrientId::kCalcium, 120.0);
  return p;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestLoggingCreatesOneLogPerDay() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());
  assert(!product.id.empty());

  auto morning = store->LogProduct(product.id, 150, MakeLocalTime(2026, 1, 15, 8, 0));
  auto evening = store->LogProduct(product.id, 50, MakeLocalTime(2026, 1, 15, 21, 30));
  auto next    = store->LogProduct(product.id, 50, MakeLocalTime(2026, 1, 16, 0, 5));

  assert(morning.daily_log_id == evening.daily_log_id);
  assert(morning.daily_log_id != next.daily_log_id);
  assert(morning.product_name == "Greek style yoghurt");
  assert(Near(morning.snapshot.calories, 123));
  assert(morning.unit == "g");

  auto log = store->FindOrCreateDailyLog(MakeLocalTime(2026, 1, 15, 12, 0));
  assert(log.id == *morning.daily_log_id);
  assert(log.date == MakeLocalTime(2026, 1, 15));

  const auto summary = store->GetDailySummary(MakeLocalTime(2026, 1, 15));
  assert(summary.food_entry_count == 2);
  assert(Near(summary.totals.calories, 164));
  assert(Near(*summary.nutrients.Get(NutrientId::kCalcium), 240));
}

void TestPortionLogging() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());

  auto entry = store->LogProductPortions(product.id, 2, MakeLocalTime(2026, 1, 15, 10, 0));
  assert(Near(entry.amount, 230));
  assert(Near(entry.snapshot.calories, 188.6));
  assert(Near(entry.snapshot.protein, 10.35));
}

void TestAmountChangesAreClamped() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());
  auto entry   = store->LogProduct(product.id, 100, MakeLocalTime(2026, 1, 15, 8, 0));

  auto updated = store->SetEntryAmount(entry.id, 12000);
  assert(updated.amount == 5000);
  assert(Near(updated.snapshot.calories, 4100));

  updated = store->AdjustEntryAmount(entry.id, -6000);
  assert(updated.amount == 1);
  assert(Near(updated.snapshot.calories, 0.82));

  updated = store->AdjustEntryAmount(entry.id, 9);
  assert(updated.amount == 10);
  assert(Near(updated.snapshot.calories, 8.2));

  // absent fields stay absent through rescaling
  assert(!updated.snapshot.fat.has_value());

  const auto graph = store->Snapshot();
  assert(graph.food_entries.size() == 1);
  assert(graph.food_entries[0] == updated);
}

void TestProductDeleteKeepsSnapshots() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());
  auto entry   = store->LogProduct(product.id, 150, MakeLocalTime(2026, 1, 15, 8, 0));

  store->DeleteProduct(product.id);
  assert(!store->GetProduct(product.id).has_value());

  const auto graph = store->Snapshot();
  assert(graph.food_entries.size() == 1);
  const auto& kept = graph.food_entries[0];
  assert(!kept.product_id.has_value());
  assert(kept.snapshot == entry.snapshot);
  assert(DisplayName(kept, std::nullopt) == "Greek style yoghurt");

  assert(Throws<nutrition::util::NotFound>([&] { store->DeleteProduct(product.id); }));
}

void TestDailyLogDeleteCascades() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());

  SupplementRecord magnesium;
  magnesium.name = "Magnesium";
  magnesium.nutrients.Set(NutrientId::kMagnesium, 150.0);
  magnesium = store->AddSupplement(magnesium);

  auto entry = store->LogProduct(product.id, 100, MakeLocalTime(2026, 1, 15, 8, 0));
  store->LogSupplement(magnesium.id, 2, MakeLocalTime(2026, 1, 15, 8, 1));
  store->LogProduct(product.id, 100, MakeLocalTime(2026, 1, 16, 8, 0));

  store->DeleteDailyLog(*entry.daily_log_id);

  const auto graph = store->Snapshot();
  assert(graph.daily_logs.size() == 1);
  assert(graph.food_entries.size() == 1);
  assert(graph.supplement_entries.empty());
  assert(graph.products.size() == 1);
  assert(graph.supplements.size() == 1);
}

void TestSupplements() {
  auto store = MakeStore();

  SupplementRecord multi;
  multi.name         = "Multivitamin";
  multi.brand        = "Centrum";
  multi.serving_size = 2;
  multi.nutrients.Set(NutrientId::kVitaminC, 80.0);
  multi = store->AddSupplement(multi);

  auto taken = store->LogSupplement(multi.id, 1, MakeLocalTime(2026, 1, 15, 9, 0));
  assert(Near(taken.nutrients.Get(NutrientId::kVitaminC), 40));
  assert(taken.supplement_name == "Multivitamin");
  assert(taken.unit == "tablet");

  store->DeleteSupplement(multi.id);
  const auto graph = store->Snapshot();
  assert(graph.supplement_entries.size() == 1);
  assert(!graph.supplement_entries[0].supplement_id.has_value());
  assert(DisplayName(graph.supplement_entries[0], std::nullopt) == "Multivitamin");

  store->DeleteSupplementEntry(taken.id);
  assert(store->Snapshot().supplement_entries.empty());
}

void TestTemplates() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());
  auto entry   = store->LogProduct(product.id, 200, MakeLocalTime(2026, 1, 15, 8, 0));

  auto tmpl = store->CaptureTemplate(entry.id, "Yoghurt bowl", 200);
  assert(tmpl.use_count == 1);
  assert(tmpl.snapshot == entry.snapshot);

  auto logged = store->LogTemplate(tmpl.id, MakeLocalTime(2026, 1, 16, 8, 0));
  assert(logged.ai_generated);
  assert(logged.custom_food_name == "Yoghurt bowl");
  assert(logged.snapshot == entry.snapshot);

  const auto templates = store->ListAiTemplates();
  assert(templates.size() == 1);
  assert(templates[0].use_count == 2);

  auto derived = store->CreateProductFromTemplate(tmpl.id);
  assert(derived.is_custom);
  assert(Near(derived.per_100g.calories, 82));
  assert(store->ListProducts().size() == 2);
}

void TestCustomFood() {
  auto store = MakeStore();

  nutrition::model::NutritionFacts estimate;
  estimate.calories = 640;
  estimate.protein  = 28;

  auto entry = store->LogCustomFood("Pad thai", 1, "plate", estimate, MakeLocalTime(2026, 1, 15, 19, 0),
                                    std::string("pad thai from the place on the corner"));
  assert(entry.ai_generated);
  assert(entry.daily_log_id.has_value());
  assert(DisplayName(entry, std::nullopt) == "Pad thai");

  auto manual = store->LogCustomFood("Apple", 1, "piece", estimate, MakeLocalTime(2026, 1, 15, 15, 0));
  assert(!manual.ai_generated);
}

void TestErrorsLeaveStoreUnchanged() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());

  using nutrition::util::InvalidAmount;
  using nutrition::util::NotFound;
  assert(Throws<InvalidAmount>([&] { store->LogProduct(product.id, 0, MakeLocalTime(2026, 1, 15)); }));
  assert(Throws<NotFound>([&] { store->LogProduct("missing", 10, MakeLocalTime(2026, 1, 15)); }));
  assert(Throws<NotFound>([&] { store->SetEntryAmount("missing", 10); }));
  assert(Throws<NotFound>([&] { store->LogTemplate("missing", MakeLocalTime(2026, 1, 15)); }));

  auto no_portion = product;
  no_portion.id.clear();
  no_portion.name = "Loose oats";
  no_portion.portion_size.reset();
  no_portion = store->AddProduct(no_portion);
  assert(Throws<InvalidAmount>([&] { store->LogProductPortions(no_portion.id, 1, MakeLocalTime(2026, 1, 15)); }));

  const auto graph = store->Snapshot();
  assert(graph.daily_logs.empty());
  assert(graph.food_entries.empty());
}

void TestConfiguredTargetsAndSugarPolicy() {
  StoreOptions options;
  options.targets.calories = 2400;
  options.targets.protein  = 140;
  options.sugar_policy     = AddedSugarPolicy::kTreatAsAdded;
  auto store               = MakeStore(options);

  const auto empty = store->GetDailySummary(MakeLocalTime(2026, 3, 1));
  assert(empty.log.calorie_target == 2400);
  assert(empty.food_entry_count == 0);
  assert(empty.calories_remaining == 2400);
  assert(store->Snapshot().daily_logs.empty());

  auto product = store->AddProduct(Yoghurt());
  auto entry   = store->LogProduct(product.id, 100, MakeLocalTime(2026, 3, 1, 7, 0));
  assert(Near(entry.snapshot.added_sugar, 3.2));
  assert(Near(entry.snapshot.natural_sugar, 0));

  const auto log = store->FindOrCreateDailyLog(MakeLocalTime(2026, 3, 1));
  assert(log.protein_target == 140);
}

void TestImportRoundTripIsIdempotent() {
  auto source  = MakeStore();
  auto product = source->AddProduct(Yoghurt());
  source->LogProduct(product.id, 150, MakeLocalTime(2026, 1, 15, 8, 0));
  source->LogProductPortions(product.id, 1, MakeLocalTime(2026, 1, 16, 8, 0));

  const auto doc     = nutrition::backup::BackupCodec::Encode(source->Snapshot(), MakeLocalTime(2026, 2, 1));
  const auto decoded = nutrition::backup::BackupCodec::Decode(doc);

  auto target = MakeStore();
  auto first  = target->ApplyImport(decoded);
  assert(first.products.imported == 1);
  assert(first.daily_logs.imported == 2);
  assert(first.food_entries.imported == 2);

  auto second = target->ApplyImport(decoded);
  assert(second.TotalImported() == 0);
  assert(second.TotalSkipped() == 5);

  // re-exporting gives the same document
  assert(nutrition::backup::BackupCodec::Encode(target->Snapshot(), MakeLocalTime(2026, 2, 1)) == doc);
}

void TestWritersSerializeWithImport() {
  auto store   = MakeStore();
  auto product = store->AddProduct(Yoghurt());

  auto other   = MakeStore();
  auto remote  = other->AddProduct(Yoghurt());
  for (int day = 1; day <= 20; ++day) {
    other->LogProduct(remote.id, 100, MakeLocalTime(2026, 4, day, 12, 0));
  }
  const auto decoded = nutrition::backup::BackupCodec::Decode(
      nutrition::backup::BackupCodec::Encode(other->Snapshot(), MakeLocalTime(2026, 5, 1)));

  constexpr int kThreads = 4;
  constexpr int kPerThread = 25;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        store->LogProduct(product.id, 10 + i, MakeLocalTime(2026, 4, 1 + (i % 20), 6 + t, i));
      }
    });
  }
  auto summary = store->ApplyImport(decoded);
  for (auto& w : writers) w.join();

  assert(summary.products.skipped == 1);
  assert(summary.food_entries.imported == 20);

  const auto graph = store->Snapshot();
  assert(graph.food_entries.size() == static_cast<std::size_t>(kThreads * kPerThread + 20));
  assert(graph.daily_logs.size() == 20);
  assert(graph.products.size() == 1);
}

} // namespace

int main() {
  TestLoggingCreatesOneLogPerDay();
  TestPortionLogging();
  TestAmountChangesAreClamped();
  TestProductDeleteKeepsSnapshots();
  TestDailyLogDeleteCascades();
  TestSupplements();
  TestTemplates();
  TestCustomFood();
  TestErrorsLeaveStoreUnchanged();
  TestConfiguredTargetsAndSugarPolicy();
  TestImportRoundTripIsIdempotent();
  TestWritersSerializeWithImport();

  std::cout << "nutrition_unit_nutrition_store: pass\n";
  return 0;
}
