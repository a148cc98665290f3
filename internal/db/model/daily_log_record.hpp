#pragma once

#include <string>

#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  One calendar day.

  date is local midnight. At most one log exists per calendar day.
  Deleting a log deletes its food and supplement entries.
*/

struct DailyLogRecord {
  std::string     id;
  util::TimePoint date{};

  double calorie_target = 2000;
  double protein_target = 50;
  double carb_target    = 250;
  double fat_target     = 65;

  bool operator==(const DailyLogRecord&) const = default;
};

} // namespace nutrition::db::model
