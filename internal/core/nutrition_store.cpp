#include "nutrition_store.hpp"

#include "internal/backup/import_reconciler.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace nutrition::core {

using namespace nutrition::db::model;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StorageFailure(message + " (" + db::ToString(result.code) + ")");
  }
}

template <typename T>
T Require(std::optional<T> value, const std::string& what, const std::string& id) {
  if (!value) throw util::NotFound(what + " not found: " + id);
  return std::move(*value);
}

} // namespace

NutritionStore::NutritionStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(options), scaling_(options.limits) {
}

// ------------------------------------------------------------------
// Products / supplements / templates
// ------------------------------------------------------------------

ProductRecord NutritionStore::AddProduct(ProductRecord product) {
  if (product.id.empty()) product.id = util::NewId();
  if (product.date_added == util::TimePoint{}) product.date_added = util::Now();

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertProduct(*tx, product), "add product");
  tx->Commit();
  return product;
}

std::optional<ProductRecord> NutritionStore::GetProduct(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  auto            record = repository_->GetProduct(*tx, id);
  tx->Commit();
  return record;
}

std::vector<ProductRecord> NutritionStore::ListProducts() {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->ListProducts(*tx);
  tx->Commit();
  return records;
}

void NutritionStore::DeleteProduct(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteProduct(*tx, id), "delete product " + id);
  tx->Commit();
}

SupplementRecord NutritionStore::AddSupplement(SupplementRecord supplement) {
  if (supplement.id.empty()) supplement.id = util::NewId();
  if (supplement.date_added == util::TimePoint{}) supplement.date_added = util::Now();

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertSupplement(*tx, supplement), "add supplement");
  tx->Commit();
  return supplement;
}

std::vector<SupplementRecord> NutritionStore::ListSupplements() {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->ListSupplements(*tx);
  tx->Commit();
  return records;
}

void NutritionStore::DeleteSupplement(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteSupplement(*tx, id), "delete supplement " + id);
  tx->Commit();
}

AiTemplateRecord NutritionStore::AddAiTemplate(AiTemplateRecord tmpl) {
  if (tmpl.id.empty()) tmpl.id = util::NewId();
  if (tmpl.date_created == util::TimePoint{}) tmpl.date_created = util::Now();
  if (tmpl.last_used == util::TimePoint{}) tmpl.last_used = tmpl.date_created;

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertAiTemplate(*tx, tmpl), "add AI template");
  tx->Commit();
  return tmpl;
}

std::vector<AiTemplateRecord> NutritionStore::ListAiTemplates() {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            records = repository_->ListAiTemplates(*tx);
  tx->Commit();
  return records;
}

AiTemplateRecord NutritionStore::CaptureTemplate(const std::string& entry_id, const std::string& name, double weight_in_grams) {
  std::lock_guard lock(mutex_);
  auto            tx    = repository_->Begin();
  const auto      entry = Require(repository_->GetFoodEntry(*tx, entry_id), "food entry", entry_id);

  AiTemplateRecord tmpl;
  tmpl.id              = util::NewId();
  tmpl.name            = name;
  tmpl.amount          = entry.amount;
  tmpl.unit            = entry.unit;
  tmpl.weight_in_grams = weight_in_grams;
  tmpl.snapshot        = entry.snapshot;
  tmpl.ai_prompt       = entry.ai_prompt;
  tmpl.date_created    = util::Now();
  tmpl.last_used       = tmpl.date_created;

  ThrowIfDbError(repository_->InsertAiTemplate(*tx, tmpl), "capture AI template");
  tx->Commit();
  return tmpl;
}

ProductRecord NutritionStore::CreateProductFromTemplate(const std::string& template_id) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      tmpl    = Require(repository_->GetAiTemplate(*tx, template_id), "AI template", template_id);
  auto            product = ScalingEngine::DeriveProductFromTemplate(tmpl, util::Now());
  product.per_100g        = ApplyAddedSugarPolicy(product.per_100g, options_.sugar_policy);

  ThrowIfDbError(repository_->InsertProduct(*tx, product), "create product from template");
  tx->Commit();
  return product;
}

// ------------------------------------------------------------------
// Daily logs
// ------------------------------------------------------------------

DailyLogRecord NutritionStore::FindOrCreateDailyLogLocked(db::Transaction& tx, util::TimePoint date) {
  const auto day_start = util::StartOfDay(date);
  if (auto existing = repository_->FindDailyLogInRange(tx, day_start, util::StartOfNextDay(day_start))) {
    return *existing;
  }

  DailyLogRecord log;
  log.id             = util::NewId();
  log.date           = day_start;
  log.calorie_target = options_.targets.calories;
  log.protein_target = options_.targets.protein;
  log.carb_target    = options_.targets.carbs;
  log.fat_target     = options_.targets.fat;
  ThrowIfDbError(repository_->InsertDailyLog(tx, log), "create daily log");
  return log;
}

DailyLogRecord NutritionStore::FindOrCreateDailyLog(util::TimePoint date) {
  std::lock_guard lock(mutex_);
  auto            tx  = repository_->Begin();
  auto            log = FindOrCreateDailyLogLocked(*tx, date);
  tx->Commit();
  return log;
}

void NutritionStore::DeleteDailyLog(const std::string& id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteDailyLog(*tx, id), "delete daily log " + id);
  tx->Commit();
}

// ------------------------------------------------------------------
// Logging consumption
// ------------------------------------------------------------------

FoodEntryRecord NutritionStore::InsertEntryLocked(db::Transaction& tx, FoodEntryRecord entry) {
  entry.daily_log_id = FindOrCreateDailyLogLocked(tx, entry.timestamp).id;
  ThrowIfDbError(repository_->InsertFoodEntry(tx, entry), "log food entry");
  return entry;
}

FoodEntryRecord NutritionStore::LogProduct(const std::string& product_id, double grams, util::TimePoint when) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      product = Require(repository_->GetProduct(*tx, product_id), "product", product_id);

  FoodEntryRecord entry;
  entry.id           = util::NewId();
  entry.product_id   = product.id;
  entry.product_name = product.name;
  entry.amount       = grams;
  entry.unit         = "g";
  entry.timestamp    = when;
  entry.snapshot     = ApplyAddedSugarPolicy(ScalingEngine::ScaleFromPer100g(product, grams), options_.sugar_policy);

  entry = InsertEntryLocked(*tx, std::move(entry));
  tx->Commit();
  return entry;
}

FoodEntryRecord NutritionStore::LogProductPortions(const std::string& product_id, double portions, util::TimePoint when) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      product = Require(repository_->GetProduct(*tx, product_id), "product", product_id);

  FoodEntryRecord entry;
  entry.id           = util::NewId();
  entry.product_id   = product.id;
  entry.product_name = product.name;
  entry.snapshot     = ApplyAddedSugarPolicy(ScalingEngine::ScaleFromPortions(product, portions), options_.sugar_policy);
  entry.amount       = *product.portion_size * portions;
  entry.unit         = "g";
  entry.timestamp    = when;

  entry = InsertEntryLocked(*tx, std::move(entry));
  tx->Commit();
  return entry;
}

SupplementEntryRecord NutritionStore::LogSupplement(const std::string& supplement_id, double amount, util::TimePoint when) {
  std::lock_guard lock(mutex_);
  auto            tx         = repository_->Begin();
  const auto      supplement = Require(repository_->GetSupplement(*tx, supplement_id), "supplement", supplement_id);

  SupplementEntryRecord entry;
  entry.id              = util::NewId();
  entry.supplement_id   = supplement.id;
  entry.supplement_name = supplement.name;
  entry.nutrients       = ScalingEngine::ScaleFromServings(supplement, amount);
  entry.amount          = amount;
  entry.unit            = supplement.serving_size_unit;
  entry.timestamp       = when;
  entry.daily_log_id    = FindOrCreateDailyLogLocked(*tx, when).id;

  ThrowIfDbError(repository_->InsertSupplementEntry(*tx, entry), "log supplement entry");
  tx->Commit();
  return entry;
}

FoodEntryRecord NutritionStore::LogTemplate(const std::string& template_id, util::TimePoint when) {
  std::lock_guard lock(mutex_);
  auto            tx   = repository_->Begin();
  auto            tmpl = Require(repository_->GetAiTemplate(*tx, template_id), "AI template", template_id);

  auto entry = InsertEntryLocked(*tx, ScalingEngine::EntryFromTemplate(tmpl, when));

  tmpl.RecordUse(util::Now());
  ThrowIfDbError(repository_->UpdateAiTemplate(*tx, tmpl), "record template use");
  tx->Commit();
  return entry;
}

FoodEntryRecord NutritionStore::LogCustomFood(const std::string& name, double amount, const std::string& unit,
                                              const model::NutritionFacts& snapshot, util::TimePoint when,
                                              std::optional<std::string> ai_prompt) {
  // same floor as any other amount; the snapshot is already absolute
  if (!(amount > 0)) throw util::InvalidAmount("amount must be positive");

  FoodEntryRecord entry;
  entry.id               = util::NewId();
  entry.custom_food_name = name;
  entry.amount           = amount;
  entry.unit             = unit;
  entry.timestamp        = when;
  entry.snapshot         = snapshot;
  entry.ai_generated     = ai_prompt.has_value();
  entry.ai_prompt        = std::move(ai_prompt);

  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  entry              = InsertEntryLocked(*tx, std::move(entry));
  tx->Commit();
  return entry;
}

// ------------------------------------------------------------------
// Amount changes
// ------------------------------------------------------------------

FoodEntryRecord NutritionStore::RescaleLocked(const std::string& entry_id, double amount, AmountSource source, bool relative) {
  auto tx    = repository_->Begin();
  auto entry = Require(repository_->GetFoodEntry(*tx, entry_id), "food entry", entry_id);

  scaling_.RescaleEntry(entry, relative ? entry.amount + amount : amount, source);

  ThrowIfDbError(repository_->UpdateFoodEntry(*tx, entry), "update food entry " + entry_id);
  tx->Commit();
  return entry;
}

FoodEntryRecord NutritionStore::SetEntryAmount(const std::string& entry_id, double amount) {
  std::lock_guard lock(mutex_);
  return RescaleLocked(entry_id, amount, AmountSource::kDirectEntry, false);
}

FoodEntryRecord NutritionStore::AdjustEntryAmount(const std::string& entry_id, double delta) {
  std::lock_guard lock(mutex_);
  return RescaleLocked(entry_id, delta, AmountSource::kAdjustment, true);
}

void NutritionStore::DeleteEntry(const std::string& entry_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteFoodEntry(*tx, entry_id), "delete food entry " + entry_id);
  tx->Commit();
}

void NutritionStore::DeleteSupplementEntry(const std::string& entry_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteSupplementEntry(*tx, entry_id), "delete supplement entry " + entry_id);
  tx->Commit();
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

DailySummary NutritionStore::GetDailySummary(util::TimePoint date) {
  std::lock_guard lock(mutex_);
  auto            tx        = repository_->Begin();
  const auto      day_start = util::StartOfDay(date);
  const auto      log       = repository_->FindDailyLogInRange(*tx, day_start, util::StartOfNextDay(day_start));

  DailySummary summary;
  if (log) {
    summary = Summarize(*log, repository_->ListFoodEntriesForLog(*tx, log->id),
                        repository_->ListSupplementEntriesForLog(*tx, log->id));
  } else {
    DailyLogRecord empty;
    empty.date           = day_start;
    empty.calorie_target = options_.targets.calories;
    empty.protein_target = options_.targets.protein;
    empty.carb_target    = options_.targets.carbs;
    empty.fat_target     = options_.targets.fat;
    summary              = Summarize(empty, {}, {});
  }
  tx->Commit();
  return summary;
}

backup::EntityGraph NutritionStore::Snapshot() {
  std::lock_guard     lock(mutex_);
  auto                tx = repository_->Begin();
  backup::EntityGraph graph;
  graph.products           = repository_->ListProducts(*tx);
  graph.daily_logs         = repository_->ListDailyLogs(*tx);
  graph.food_entries       = repository_->ListFoodEntries(*tx);
  graph.ai_templates       = repository_->ListAiTemplates(*tx);
  graph.supplements        = repository_->ListSupplements(*tx);
  graph.supplement_entries = repository_->ListSupplementEntries(*tx);
  tx->Commit();
  return graph;
}

backup::ImportSummary NutritionStore::ApplyImport(const backup::DecodedGraph& decoded) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();

  backup::ImportReconciler reconciler(*repository_);
  auto                     summary = reconciler.Apply(*tx, decoded.graph);

  try {
    tx->Commit();
  } catch (const std::exception& e) {
    // the transaction's destructor rolls back
    throw util::StorageFailure(std::string("import commit failed: ") + e.what());
  }
  return summary;
}

} // namespace nutrition::core
