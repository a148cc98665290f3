#pragma once

#include <optional>

#include "internal/model/nutrient_map.hpp"

namespace nutrition::model {

/*
  Macro fields plus sparse nutrient map.

  One value type shared by every entity that carries nutrition: products
  hold it per 100 g, food entries and AI templates hold an amount-scaled
  snapshot. Every field is optional; a present zero and an absent value
  are different things.

  sodium and cholesterol are in mg, everything else in g (calories kcal).
*/
struct NutritionFacts {
  std::optional<double> calories;
  std::optional<double> protein;
  std::optional<double> carbohydrates;
  std::optional<double> fat;
  std::optional<double> saturated_fat;
  std::optional<double> trans_fat;
  std::optional<double> fibre;
  std::optional<double> sugar;
  std::optional<double> natural_sugar;
  std::optional<double> added_sugar;
  std::optional<double> sodium;
  std::optional<double> cholesterol;

  NutrientMap nutrients;

  // Every present field multiplied by factor; absent fields stay absent.
  NutritionFacts Scaled(double factor) const;

  bool operator==(const NutritionFacts&) const = default;
};

// Calls fn(name, field) for each macro field, in declaration order.
template <typename Facts, typename Fn>
void ForEachMacro(Facts& facts, Fn&& fn) {
  fn("calories", facts.calories);
  fn("protein", facts.protein);
  fn("carbohydrates", facts.carbohydrates);
  fn("fat", facts.fat);
  fn("saturatedFat", facts.saturated_fat);
  fn("transFat", facts.trans_fat);
  fn("fibre", facts.fibre);
  fn("sugar", facts.sugar);
  fn("naturalSugar", facts.natural_sugar);
  fn("addedSugar", facts.added_sugar);
  fn("sodium", facts.sodium);
  fn("cholesterol", facts.cholesterol);
}

} // namespace nutrition::model
