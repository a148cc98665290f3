#pragma once

#include <string>
#include <unordered_map>

#include "internal/backup/entity_graph.hpp"
#include "internal/backup/import_summary.hpp"
#include "internal/db/api/repository.hpp"

namespace nutrition::backup {

/*
  Merges a decoded graph into the live store.

  Order matters: products, daily logs, food entries, AI templates, then
  supplements and supplement entries. Entries are re-homed through the
  id maps built by the earlier stages.

  Policy is "existing data wins": a matched entity is skipped, never
  merged field by field.

  Apply() only writes through the given transaction; the caller commits.
  A rejected write throws util::StorageFailure and the caller must roll
  back, so an import is all-or-nothing.
*/
class ImportReconciler {
 public:
  explicit ImportReconciler(db::Repository& repo);

  ImportSummary Apply(db::Transaction& tx, const EntityGraph& graph);

 private:
  using IdMap = std::unordered_map<std::string, std::string>;

  void ImportProducts(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);
  void ImportDailyLogs(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);
  void ImportFoodEntries(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);
  void ImportAiTemplates(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);
  void ImportSupplements(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);
  void ImportSupplementEntries(db::Transaction& tx, const EntityGraph& graph, ImportSummary& summary);

  db::Repository& repo_;

  IdMap product_ids_;
  IdMap daily_log_ids_;
  IdMap supplement_ids_;
};

} // namespace nutrition::backup
