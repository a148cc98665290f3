#pragma once

#include <optional>
#include <string>

#include "internal/model/nutrient_map.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  A logged supplement intake; amount is in units (tablets, ...), the
  nutrient snapshot is frozen at log time.
*/

struct SupplementEntryRecord {
  std::string id;

  std::optional<std::string> supplement_id; // nullified on supplement delete
  std::optional<std::string> daily_log_id;
  std::optional<std::string> supplement_name;

  double          amount = 1;
  std::string     unit   = "tablet";
  util::TimePoint timestamp{};

  nutrition::model::NutrientMap nutrients;

  bool operator==(const SupplementEntryRecord&) const = default;
};

// Captured name wins here, unlike food entries.
inline std::string DisplayName(const SupplementEntryRecord& entry,
                               const std::optional<std::string>& live_supplement_name) {
  if (entry.supplement_name && !entry.supplement_name->empty()) return *entry.supplement_name;
  return live_supplement_name.value_or("Unknown Supplement");
}

} // namespace nutrition::db::model
