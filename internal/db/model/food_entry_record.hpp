#pragma once

#include <optional>
#include <string>

#include "internal/model/nutrition_facts.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  A logged consumption event.

  snapshot is frozen when the entry is created or its amount changes. It
  does not follow later edits of the source product. product_name keeps
  the product's name at log time so the entry still displays after the
  product is deleted.
*/

struct FoodEntryRecord {
  std::string id;

  std::optional<std::string> product_id;   // weak, nullified on product delete
  std::optional<std::string> daily_log_id; // owner
  std::optional<std::string> product_name;
  std::optional<std::string> custom_food_name;

  double          amount = 0;
  std::string     unit   = "g";
  util::TimePoint timestamp{};

  nutrition::model::NutritionFacts snapshot;

  bool                       ai_generated = false;
  std::optional<std::string> ai_prompt;

  bool operator==(const FoodEntryRecord&) const = default;
};

// Live product name > captured product name > custom name > "Unknown food".
inline std::string DisplayName(const FoodEntryRecord& entry, const std::optional<std::string>& live_product_name) {
  if (live_product_name) return *live_product_name;
  if (entry.product_name) return *entry.product_name;
  return entry.custom_food_name.value_or("Unknown food");
}

} // namespace nutrition::db::model
