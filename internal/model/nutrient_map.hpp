#pragma once

#include <map>
#include <optional>

#include "internal/model/nutrient_catalog.hpp"

namespace nutrition::model {

/*
  Sparse nutrient values keyed by NutrientId.

  Absence means "unknown", not zero. Scaling only touches keys that are
  present; it never materializes an absent key and never drops a present
  zero.
*/
class NutrientMap {
 public:
  using Storage        = std::map<NutrientId, double>;
  using const_iterator = Storage::const_iterator;

  std::optional<double> Get(NutrientId id) const;
  void                  Set(NutrientId id, double value);
  void                  Set(NutrientId id, std::optional<double> value);
  void                  Erase(NutrientId id);

  bool Contains(NutrientId id) const {
    return values_.contains(id);
  }
  bool empty() const {
    return values_.empty();
  }
  std::size_t size() const {
    return values_.size();
  }

  const_iterator begin() const {
    return values_.begin();
  }
  const_iterator end() const {
    return values_.end();
  }

  NutrientMap Scaled(double factor) const;

  // Adds every present value of other into this map.
  void Accumulate(const NutrientMap& other);

  bool operator==(const NutrientMap&) const = default;

 private:
  Storage values_;
};

} // namespace nutrition::model
