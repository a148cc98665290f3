#include "internal/model/nutrient_map.hpp"

namespace nutrition::model {

std::optional<double> NutrientMap::Get(NutrientId id) const {
  auto it = values_.find(id);
  if (it == values_.end()) return std::nullopt;
  return it->second;
}

void NutrientMap::Set(NutrientId id, double value) {
  values_[id] = value;
}

void NutrientMap::Set(NutrientId id, std::optional<double> value) {
  if (value) {
    values_[id] = *value;
  } else {
    values_.erase(id);
  }
}

void NutrientMap::Erase(NutrientId id) {
  values_.erase(id);
}

NutrientMap NutrientMap::Scaled(double factor) const {
  NutrientMap out;
  for (const auto& [id, value] : values_) {
    out.values_.emplace(id, value * factor);
  }
  return out;
}

void NutrientMap::Accumulate(const NutrientMap& other) {
  for (const auto& [id, value] : other.values_) {
    values_[id] += value;
  }
}

} // namespace nutrition::model
