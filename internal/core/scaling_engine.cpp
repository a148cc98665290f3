#include "scaling_engine.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace nutrition::core {

using nutrition::model::NutrientMap;
using nutrition::model::NutritionFacts;

namespace {

void RequirePositive(double value, const char* what) {
  if (!std::isfinite(value) || value <= 0) {
    throw util::InvalidAmount(std::string(what) + " must be a positive number, got " + std::to_string(value));
  }
}

} // namespace

NutritionFacts ApplyAddedSugarPolicy(NutritionFacts facts, AddedSugarPolicy policy) {
  if (policy != AddedSugarPolicy::kTreatAsAdded) return facts;
  if (!facts.sugar || facts.natural_sugar || facts.added_sugar) return facts;

  facts.added_sugar   = *facts.sugar;
  facts.natural_sugar = 0.0;
  return facts;
}

ScalingEngine::ScalingEngine(ScalingLimits limits) : limits_(limits) {
  if (limits_.min_amount <= 0 || limits_.max_direct_amount < limits_.min_amount) {
    throw util::InvalidAmount("invalid scaling limits");
  }
}

NutritionFacts ScalingEngine::ScaleFromPer100g(const NutritionFacts& per_100g, double grams) {
  RequirePositive(grams, "grams");
  return per_100g.Scaled(grams / 100.0);
}

NutritionFacts ScalingEngine::ScaleFromPer100g(const db::model::ProductRecord& product, double grams) {
  return ScaleFromPer100g(product.per_100g, grams);
}

NutritionFacts ScalingEngine::ScaleFromPortions(const db::model::ProductRecord& product, double portions) {
  if (!product.portion_size) {
    throw util::InvalidAmount("product '" + product.name + "' has no portion size");
  }
  RequirePositive(*product.portion_size, "portion size");
  RequirePositive(portions, "portions");
  return ScaleFromPer100g(product.per_100g, *product.portion_size * portions);
}

NutrientMap ScalingEngine::ScaleFromServings(const db::model::SupplementRecord& supplement, double servings) {
  RequirePositive(supplement.serving_size, "serving size");
  RequirePositive(servings, "servings");
  return supplement.nutrients.Scaled(servings / supplement.serving_size);
}

NutritionFacts ScalingEngine::DerivePer100gFromWeight(const NutritionFacts& snapshot, double weight_grams) {
  if (std::isnan(weight_grams)) throw util::InvalidAmount("weight is not a number");
  return snapshot.Scaled(100.0 / std::max(weight_grams, 1.0));
}

double ScalingEngine::ClampAmount(double requested, AmountSource source) const {
  if (std::isnan(requested)) throw util::InvalidAmount("amount is not a number");

  double amount = std::max(requested, limits_.min_amount);
  if (source == AmountSource::kDirectEntry) amount = std::min(amount, limits_.max_direct_amount);
  return amount;
}

NutritionFacts ScalingEngine::Rescale(const NutritionFacts& snapshot, double current_amount, double new_amount,
                                      AmountSource source) const {
  RequirePositive(current_amount, "current amount");
  const double clamped = ClampAmount(new_amount, source);
  return snapshot.Scaled(clamped / current_amount);
}

void ScalingEngine::RescaleEntry(db::model::FoodEntryRecord& entry, double new_amount, AmountSource source) const {
  const double clamped = ClampAmount(new_amount, source);
  entry.snapshot       = Rescale(entry.snapshot, entry.amount, clamped, source);
  entry.amount         = clamped;
}

void ScalingEngine::RescaleEntry(db::model::SupplementEntryRecord& entry, double new_amount, AmountSource source) const {
  RequirePositive(entry.amount, "current amount");
  const double clamped = ClampAmount(new_amount, source);
  entry.nutrients      = entry.nutrients.Scaled(clamped / entry.amount);
  entry.amount         = clamped;
}

db::model::ProductRecord ScalingEngine::DeriveProductFromTemplate(const db::model::AiTemplateRecord& tmpl, util::TimePoint now) {
  db::model::ProductRecord product;
  product.id         = util::NewId();
  product.name       = tmpl.name;
  product.per_100g   = DerivePer100gFromWeight(tmpl.snapshot, tmpl.weight_in_grams);
  product.notes      = tmpl.ai_prompt;
  product.is_custom  = true;
  product.date_added = now;
  return product;
}

db::model::FoodEntryRecord ScalingEngine::EntryFromTemplate(const db::model::AiTemplateRecord& tmpl, util::TimePoint now) {
  db::model::FoodEntryRecord entry;
  entry.id               = util::NewId();
  entry.custom_food_name = tmpl.name;
  entry.amount           = tmpl.amount;
  entry.unit             = tmpl.unit;
  entry.timestamp        = now;
  entry.snapshot         = tmpl.snapshot;
  entry.ai_generated     = true;
  entry.ai_prompt        = tmpl.ai_prompt;
  return entry;
}

} // namespace nutrition::core
