#include "daily_summary.hpp"

#include <algorithm>

namespace nutrition::core {

namespace {

double Progress(double total, double target) {
  if (target <= 0) return 0;
  return std::min(total / target, 1.0);
}

} // namespace

DailySummary Summarize(const db::model::DailyLogRecord&                 log,
                       const std::vector<db::model::FoodEntryRecord>&       food_entries,
                       const std::vector<db::model::SupplementEntryRecord>& supplement_entries) {
  DailySummary summary;
  summary.log                    = log;
  summary.food_entry_count       = food_entries.size();
  summary.supplement_entry_count = supplement_entries.size();

  auto& t = summary.totals;
  for (const auto& entry : food_entries) {
    const auto& s = entry.snapshot;
    t.calories += s.calories.value_or(0);
    t.protein += s.protein.value_or(0);
    t.carbohydrates += s.carbohydrates.value_or(0);
    t.fat += s.fat.value_or(0);
    t.saturated_fat += s.saturated_fat.value_or(0);
    t.trans_fat += s.trans_fat.value_or(0);
    t.fibre += s.fibre.value_or(0);
    t.sugar += s.sugar.value_or(0);
    t.natural_sugar += s.natural_sugar.value_or(0);
    t.added_sugar += s.added_sugar.value_or(0);
    t.sodium += s.sodium.value_or(0);
    t.cholesterol += s.cholesterol.value_or(0);
    summary.nutrients.Accumulate(s.nutrients);
  }
  for (const auto& entry : supplement_entries) {
    summary.nutrients.Accumulate(entry.nutrients);
  }

  summary.calories_remaining = log.calorie_target - t.calories;
  summary.calorie_progress   = Progress(t.calories, log.calorie_target);
  summary.protein_progress   = Progress(t.protein, log.protein_target);
  summary.carb_progress      = Progress(t.carbohydrates, log.carb_target);
  summary.fat_progress       = Progress(t.fat, log.fat_target);

  for (const auto& def : model::NutrientCatalog::All()) {
    const auto amount = summary.nutrients.Get(def.id);
    if (!amount) continue;

    NutrientStatus status;
    status.id                = def.id;
    status.amount            = *amount;
    status.target            = def.target;
    status.percent_of_target = def.target > 0 ? *amount / def.target * 100.0 : 0;
    status.upper_limit       = def.upper_limit;
    status.over_upper_limit  = def.upper_limit && *amount > *def.upper_limit;
    summary.nutrient_status.push_back(status);
  }
  return summary;
}

} // namespace nutrition::core
