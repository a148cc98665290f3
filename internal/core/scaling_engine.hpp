#pragma once

#include "internal/db/model/ai_template_record.hpp"
#include "internal/db/model/food_entry_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/db/model/supplement_entry_record.hpp"
#include "internal/db/model/supplement_record.hpp"
#include "internal/model/nutrition_facts.hpp"
#include "internal/util/time.hpp"

namespace nutrition::core {

struct ScalingLimits {
  double min_amount        = 1;
  double max_direct_amount = 5000;
};

// Where a new amount comes from. Direct entry is also capped at
// max_direct_amount; stepper adjustments are only floored.
enum class AmountSource {
  kAdjustment,
  kDirectEntry,
};

/*
  Added/natural sugar split for products that only declare total sugar.

  kLeaveUnknown keeps the split absent. kTreatAsAdded books all sugar as
  added and natural as 0, the way the label-scan flow did it.
*/
enum class AddedSugarPolicy {
  kLeaveUnknown,
  kTreatAsAdded,
};

model::NutritionFacts ApplyAddedSugarPolicy(model::NutritionFacts facts, AddedSugarPolicy policy);

/*
  Amount-proportional scaling.

  All math is plain double precision with no rounding; rounding to display
  precision is a presentation concern. Absent fields stay absent, present
  zeros stay present.

  Throws util::InvalidAmount for zero/negative/non-finite divisors and
  amounts.
*/
class ScalingEngine {
public:
  explicit ScalingEngine(ScalingLimits limits = {});

  // v * grams / 100 for every field.
  static model::NutritionFacts ScaleFromPer100g(const model::NutritionFacts& per_100g, double grams);
  static model::NutritionFacts ScaleFromPer100g(const db::model::ProductRecord& product, double grams);

  // Requires product.portion_size.
  static model::NutritionFacts ScaleFromPortions(const db::model::ProductRecord& product, double portions);

  // servings / supplement.serving_size for every nutrient.
  static model::NutrientMap ScaleFromServings(const db::model::SupplementRecord& supplement, double servings);

  // Inverse of ScaleFromPer100g: scale = 100 / max(weight_grams, 1).
  static model::NutritionFacts DerivePer100gFromWeight(const model::NutritionFacts& snapshot, double weight_grams);

  double ClampAmount(double requested, AmountSource source) const;

  // ratio = clamped(new_amount) / current_amount.
  model::NutritionFacts Rescale(const model::NutritionFacts& snapshot, double current_amount, double new_amount,
                                AmountSource source) const;

  // Rescales the snapshot and stores the clamped amount on the entry.
  void RescaleEntry(db::model::FoodEntryRecord& entry, double new_amount, AmountSource source) const;
  void RescaleEntry(db::model::SupplementEntryRecord& entry, double new_amount, AmountSource source) const;

  // Custom per-100 g product built from an AI template's weighed snapshot.
  static db::model::ProductRecord DeriveProductFromTemplate(const db::model::AiTemplateRecord& tmpl, util::TimePoint now);

  // Entry carrying the template's snapshot verbatim (ai_generated = true).
  static db::model::FoodEntryRecord EntryFromTemplate(const db::model::AiTemplateRecord& tmpl, util::TimePoint now);

  const ScalingLimits& limits() const {
    return limits_;
  }

private:
  ScalingLimits limits_;
};

} // namespace nutrition::core
