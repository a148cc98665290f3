#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/db/model/daily_log_record.hpp"
#include "internal/db/model/food_entry_record.hpp"
#include "internal/db/model/supplement_entry_record.hpp"
#include "internal/model/nutrient_catalog.hpp"
#include "internal/model/nutrient_map.hpp"

namespace nutrition::core {

// Absent values count as 0 in totals.
struct MacroTotals {
  double calories      = 0;
  double protein       = 0;
  double carbohydrates = 0;
  double fat           = 0;
  double saturated_fat = 0;
  double trans_fat     = 0;
  double fibre         = 0;
  double sugar         = 0;
  double natural_sugar = 0;
  double added_sugar   = 0;
  double sodium        = 0;
  double cholesterol   = 0;
};

struct NutrientStatus {
  model::NutrientId     id;
  double                amount = 0;
  double                target = 0;
  double                percent_of_target = 0;
  std::optional<double> upper_limit;
  bool                  over_upper_limit = false;
};

struct DailySummary {
  db::model::DailyLogRecord log;

  MacroTotals totals;

  // Food and supplement nutrients combined; only nutrients that were logged.
  model::NutrientMap nutrients;

  double calories_remaining = 0;

  // total / target, capped at 1.
  double calorie_progress = 0;
  double protein_progress = 0;
  double carb_progress    = 0;
  double fat_progress     = 0;

  // One per logged nutrient, catalog order.
  std::vector<NutrientStatus> nutrient_status;

  std::size_t food_entry_count       = 0;
  std::size_t supplement_entry_count = 0;
};

DailySummary Summarize(const db::model::DailyLogRecord&                 log,
                       const std::vector<db::model::FoodEntryRecord>&       food_entries,
                       const std::vector<db::model::SupplementEntryRecord>& supplement_entries);

} // namespace nutrition::core
