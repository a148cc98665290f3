#include "internal/model/nutrition_facts.hpp"

namespace nutrition::model {

NutritionFacts NutritionFacts::Scaled(double factor) const {
  NutritionFacts out = *this;
  ForEachMacro(out, [factor](const char*, std::optional<double>& field) {
    if (field) *field *= factor;
  });
  out.nutrients = nutrients.Scaled(factor);
  return out;
}

} // namespace nutrition::model
