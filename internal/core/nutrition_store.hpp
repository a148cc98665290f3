#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/backup/entity_graph.hpp"
#include "internal/backup/import_summary.hpp"
#include "internal/core/daily_summary.hpp"
#include "internal/core/scaling_engine.hpp"
#include "internal/db/api/repository.hpp"

namespace nutrition::core {

struct DailyTargets {
  double calories = 2000;
  double protein  = 50;
  double carbs    = 250;
  double fat      = 65;
};

struct StoreOptions {
  ScalingLimits    limits;
  AddedSugarPolicy sugar_policy = AddedSugarPolicy::kLeaveUnknown;
  DailyTargets     targets;
};

/*
  Live store facade.

  Every operation runs in its own repository transaction and commits
  before returning. All repository access is serialized by one mutex: the
  store has a single writer, and an import is applied as one critical
  section so it cannot interleave with any other mutation.

  Throws util::NotFound for unknown ids, util::InvalidAmount from the
  scaling engine and util::StorageFailure when the repository rejects a
  write.
*/
class NutritionStore {
 public:
  explicit NutritionStore(std::shared_ptr<db::Repository> repository, StoreOptions options = {});

  // Products. An empty id is replaced with a fresh one.
  db::model::ProductRecord              AddProduct(db::model::ProductRecord product);
  std::optional<db::model::ProductRecord> GetProduct(const std::string& id);
  std::vector<db::model::ProductRecord> ListProducts();
  // Entries keep their snapshots; their product_id becomes null.
  void DeleteProduct(const std::string& id);

  db::model::SupplementRecord              AddSupplement(db::model::SupplementRecord supplement);
  std::vector<db::model::SupplementRecord> ListSupplements();
  void                                     DeleteSupplement(const std::string& id);

  db::model::AiTemplateRecord              AddAiTemplate(db::model::AiTemplateRecord tmpl);
  std::vector<db::model::AiTemplateRecord> ListAiTemplates();

  // Captures an entry's snapshot as a reusable template.
  db::model::AiTemplateRecord CaptureTemplate(const std::string& entry_id, const std::string& name, double weight_in_grams);

  // Saves a custom per-100 g product derived from a template.
  db::model::ProductRecord CreateProductFromTemplate(const std::string& template_id);

  // At most one log per local calendar day; date may be any time of day.
  db::model::DailyLogRecord FindOrCreateDailyLog(util::TimePoint date);
  // Deletes the log's food and supplement entries too.
  void DeleteDailyLog(const std::string& id);

  db::model::FoodEntryRecord LogProduct(const std::string& product_id, double grams, util::TimePoint when);
  db::model::FoodEntryRecord LogProductPortions(const std::string& product_id, double portions, util::TimePoint when);
  // amount is in the supplement's units (tablets, capsules, ...).
  db::model::SupplementEntryRecord LogSupplement(const std::string& supplement_id, double amount, util::TimePoint when);
  // Logs the template's snapshot verbatim and bumps its use counter.
  db::model::FoodEntryRecord LogTemplate(const std::string& template_id, util::TimePoint when);
  // Already-estimated nutrition (manual entry, AI estimate).
  db::model::FoodEntryRecord LogCustomFood(const std::string& name, double amount, const std::string& unit,
                                           const model::NutritionFacts& snapshot, util::TimePoint when,
                                           std::optional<std::string> ai_prompt = std::nullopt);

  db::model::FoodEntryRecord SetEntryAmount(const std::string& entry_id, double amount);
  db::model::FoodEntryRecord AdjustEntryAmount(const std::string& entry_id, double delta);

  void DeleteEntry(const std::string& entry_id);
  void DeleteSupplementEntry(const std::string& entry_id);

  // Empty summary (default targets, no entries) for a day without a log.
  DailySummary GetDailySummary(util::TimePoint date);

  // Consistent copy of every entity, for export.
  backup::EntityGraph Snapshot();

  // All-or-nothing: nothing is committed unless every stage succeeds.
  backup::ImportSummary ApplyImport(const backup::DecodedGraph& decoded);

  const ScalingEngine& scaling() const {
    return scaling_;
  }

 private:
  db::model::DailyLogRecord FindOrCreateDailyLogLocked(db::Transaction& tx, util::TimePoint date);
  db::model::FoodEntryRecord InsertEntryLocked(db::Transaction& tx, db::model::FoodEntryRecord entry);
  db::model::FoodEntryRecord RescaleLocked(const std::string& entry_id, double amount, AmountSource source, bool relative);

  std::shared_ptr<db::Repository> repository_;
  StoreOptions                    options_;
  ScalingEngine                   scaling_;

  // Single-writer boundary; also keeps the sqlite connection to one
  // transaction at a time.
  std::mutex mutex_;
};

} // namespace nutrition::core
