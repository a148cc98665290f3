#pragma once

#include <optional>
#include <vector>

#include "internal/db/model/ai_template_record.hpp"
#include "internal/db/model/daily_log_record.hpp"
#include "internal/db/model/food_entry_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/db/model/supplement_entry_record.hpp"
#include "internal/db/model/supplement_record.hpp"
#include "internal/util/time.hpp"

namespace nutrition::backup {

/*
  Flat, id-linked view of a whole store.

  Foreign keys (FoodEntryRecord::product_id, ::daily_log_id, ...) hold raw
  ids. In a decoded graph they refer to ids inside the same document and
  are only resolved against a live store by the ImportReconciler.
*/
struct EntityGraph {
  std::vector<db::model::ProductRecord>         products;
  std::vector<db::model::DailyLogRecord>        daily_logs;
  std::vector<db::model::FoodEntryRecord>       food_entries;
  std::vector<db::model::AiTemplateRecord>      ai_templates;
  std::vector<db::model::SupplementRecord>      supplements;
  std::vector<db::model::SupplementEntryRecord> supplement_entries;

  std::size_t TotalCount() const {
    return products.size() + daily_logs.size() + food_entries.size() + ai_templates.size() + supplements.size() +
           supplement_entries.size();
  }
};

struct DecodedGraph {
  int                            version = 0;
  std::optional<util::TimePoint> export_date;
  EntityGraph                    graph;
};

} // namespace nutrition::backup
