#pragma once

#include <optional>
#include <string>

#include "internal/model/nutrition_facts.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  Reusable AI estimate.

  Lives independently of products and entries and is never deleted
  automatically. snapshot is for `amount unit`, which weighs
  weight_in_grams.
*/

struct AiTemplateRecord {
  std::string id;
  std::string name;

  double      amount          = 0;
  std::string unit            = "g";
  double      weight_in_grams = 0;

  nutrition::model::NutritionFacts snapshot;

  std::optional<std::string> ai_prompt;

  util::TimePoint date_created{};
  util::TimePoint last_used{};
  int             use_count = 1;

  bool operator==(const AiTemplateRecord&) const = default;

  void RecordUse(util::TimePoint now) {
    last_used = now;
    ++use_count;
  }
};

} // namespace nutrition::db::model
