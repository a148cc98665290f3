#pragma once

#include <optional>
#include <string>

#include "internal/model/nutrient_map.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  Supplement (vitamin/mineral product).

  nutrients are per serving; serving_size is how many units (tablets,
  capsules, ...) make one serving. No macros.
*/

struct SupplementRecord {
  std::string                id;
  std::string                name;
  std::optional<std::string> brand;

  std::string dosage_form       = "tablet"; // tablet, capsule, softgel, gummy, liquid, powder
  double      serving_size      = 1;
  std::string serving_size_unit = "tablet";

  nutrition::model::NutrientMap nutrients;

  std::optional<std::string> notes;
  std::optional<std::string> image_data;
  util::TimePoint            date_added{};

  bool operator==(const SupplementRecord&) const = default;
};

} // namespace nutrition::db::model
