#include "import_reconciler.hpp"

#include "internal/backup/matching.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace nutrition::backup {

namespace {

void Check(const db::Result& result, const char* what, const std::string& id) {
  if (result) return;
  throw util::StorageFailure(std::string(what) + " " + id + " rejected: " + db::ToString(result.code) +
                             (result.message.empty() ? "" : " (" + result.message + ")"));
}

// Keeps the document's id unless a different entity already owns it.
template <typename Lookup>
std::string UnusedId(const std::string& wanted, Lookup&& exists) {
  if (!exists(wanted)) return wanted;
  std::string id;
  do {
    id = util::NewId();
  } while (exists(id));
  return id;
}

} // namespace

ImportReconciler::ImportReconciler(db::Repository& repo) : repo_(repo) {
}

ImportSummary ImportReconciler::Apply(db::Transaction& tx, const EntityGraph& graph) {
  product_ids_.clear();
  daily_log_ids_.clear();
  supplement_ids_.clear();

  ImportSummary summary;
  ImportProducts(tx, graph, summary);
  ImportDailyLogs(tx, graph, summary);
  ImportFoodEntries(tx, graph, summary);
  ImportAiTemplates(tx, graph, summary);
  ImportSupplements(tx, graph, summary);
  ImportSupplementEntries(tx, graph, summary);
  return summary;
}

void ImportReconciler::ImportProducts(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.products) {
    if (auto existing = MatchProduct(repo_, tx, incoming)) {
      product_ids_[incoming.id] = existing->id;
      ++summary.products.skipped;
      continue;
    }

    auto record = incoming;
    record.id   = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetProduct(tx, id).has_value(); });
    Check(repo_.InsertProduct(tx, record), "product", record.id);

    product_ids_[incoming.id] = record.id;
    ++summary.products.imported;
  }
}

void ImportReconciler::ImportDailyLogs(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.daily_logs) {
    if (auto existing = MatchDailyLog(repo_, tx, incoming)) {
      daily_log_ids_[incoming.id] = existing->id;
      ++summary.daily_logs.skipped;
      continue;
    }

    auto record = incoming;
    record.date = util::StartOfDay(incoming.date);
    record.id   = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetDailyLog(tx, id).has_value(); });
    Check(repo_.InsertDailyLog(tx, record), "daily log", record.id);

    daily_log_ids_[incoming.id] = record.id;
    ++summary.daily_logs.imported;
  }
}

void ImportReconciler::ImportFoodEntries(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.food_entries) {
    if (MatchFoodEntry(repo_, tx, incoming)) {
      ++summary.food_entries.skipped;
      continue;
    }

    auto record = incoming;

    // Re-home through the id maps. A reference to an entity that exists in
    // neither the document nor the store is dropped; the snapshot stays.
    if (incoming.product_id) {
      if (auto it = product_ids_.find(*incoming.product_id); it != product_ids_.end()) {
        record.product_id = it->second;
      } else if (!repo_.GetProduct(tx, *incoming.product_id)) {
        record.product_id.reset();
        ++summary.dangling_references;
        NUTRITION_LOG_DEBUG("dropping dangling product reference",
                            {observability::StringField("entry_id", incoming.id),
                             observability::StringField("product_id", *incoming.product_id)});
      }
    }
    if (incoming.daily_log_id) {
      if (auto it = daily_log_ids_.find(*incoming.daily_log_id); it != daily_log_ids_.end()) {
        record.daily_log_id = it->second;
      } else if (!repo_.GetDailyLog(tx, *incoming.daily_log_id)) {
        record.daily_log_id.reset();
        ++summary.dangling_references;
        NUTRITION_LOG_DEBUG("dropping dangling daily log reference",
                            {observability::StringField("entry_id", incoming.id),
                             observability::StringField("daily_log_id", *incoming.daily_log_id)});
      }
    }

    record.id = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetFoodEntry(tx, id).has_value(); });
    Check(repo_.InsertFoodEntry(tx, record), "food entry", record.id);
    ++summary.food_entries.imported;
  }
}

void ImportReconciler::ImportAiTemplates(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.ai_templates) {
    if (MatchAiTemplate(repo_, tx, incoming)) {
      ++summary.ai_templates.skipped;
      continue;
    }

    auto record = incoming;
    record.id   = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetAiTemplate(tx, id).has_value(); });
    Check(repo_.InsertAiTemplate(tx, record), "AI template", record.id);
    ++summary.ai_templates.imported;
  }
}

void ImportReconciler::ImportSupplements(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.supplements) {
    if (auto existing = MatchSupplement(repo_, tx, incoming)) {
      supplement_ids_[incoming.id] = existing->id;
      ++summary.supplements.skipped;
      continue;
    }

    auto record = incoming;
    record.id   = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetSupplement(tx, id).has_value(); });
    Check(repo_.InsertSupplement(tx, record), "supplement", record.id);

    supplement_ids_[incoming.id] = record.id;
    ++summary.supplements.imported;
  }
}

void ImportReconciler::ImportSupplementEntries(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary) {
  for (const auto& incoming : graph.supplement_entries) {
    if (MatchSupplementEntry(repo_, tx, incoming)) {
      ++summary.supplement_entries.skipped;
      continue;
    }

    auto record = incoming;
    if (incoming.supplement_id) {
      if (auto it = supplement_ids_.find(*incoming.supplement_id); it != supplement_ids_.end()) {
        record.supplement_id = it->second;
      } else if (!repo_.GetSupplement(tx, *incoming.supplement_id)) {
        record.supplement_id.reset();
        ++summary.dangling_references;
      }
    }
    if (incoming.daily_log_id) {
      if (auto it = daily_log_ids_.find(*incoming.daily_log_id); it != daily_log_ids_.end()) {
        record.daily_log_id = it->second;
      } else if (!repo_.GetDailyLog(tx, *incoming.daily_log_id)) {
        record.daily_log_id.reset();
        ++summary.dangling_references;
      }
    }

    record.id = UnusedId(incoming.id, [&](const std::string& id) { return repo_.GetSupplementEntry(tx, id).has_value(); });
    Check(repo_.InsertSupplementEntry(tx, record), "supplement entry", record.id);
    ++summary.supplement_entries.imported;
  }
}

} // namespace nutrition::backup
