#pragma once

#include <chrono>
#include <optional>

#include "internal/db/api/repository.hpp"

namespace nutrition::backup {

/*
  Identity resolution, one strategy per entity type.

  Every strategy looks at the store as seen by the import transaction,
  which includes entities created earlier in the same import. All of them
  are heuristics with known false positives:

  - products: two different products sharing a barcode (or, without a
    usable barcode, sharing exact name and brand) are merged.
  - daily logs: matched purely by local calendar day.
  - food entries: two genuinely distinct entries logged within the same
    second with the same calories are treated as one.
  - AI templates: names equal under Unicode case folding are the same
    ("ÉCLAIR" and "éclair"). Differently normalized forms of the same
    accented letter (precomposed vs combining mark) still differ.
  - supplements: exact name and brand.
  - supplement entries: same second window and same supplement name.
*/

inline constexpr std::chrono::seconds kEntryTimestampTolerance{1};

// Barcode first (when non-empty), then exact (name, brand); absent brand
// only matches absent brand.
std::optional<db::model::ProductRecord> MatchProduct(db::Repository& repo, db::Transaction& tx,
                                                     const db::model::ProductRecord& incoming);

std::optional<db::model::DailyLogRecord> MatchDailyLog(db::Repository& repo, db::Transaction& tx,
                                                       const db::model::DailyLogRecord& incoming);

// Pure predicate behind MatchFoodEntry.
bool SameFoodEntry(const db::model::FoodEntryRecord& existing, const db::model::FoodEntryRecord& incoming);

std::optional<db::model::FoodEntryRecord> MatchFoodEntry(db::Repository& repo, db::Transaction& tx,
                                                         const db::model::FoodEntryRecord& incoming);

std::optional<db::model::AiTemplateRecord> MatchAiTemplate(db::Repository& repo, db::Transaction& tx,
                                                           const db::model::AiTemplateRecord& incoming);

std::optional<db::model::SupplementRecord> MatchSupplement(db::Repository& repo, db::Transaction& tx,
                                                           const db::model::SupplementRecord& incoming);

bool SameSupplementEntry(const db::model::SupplementEntryRecord& existing,
                         const db::model::SupplementEntryRecord& incoming);

std::optional<db::model::SupplementEntryRecord> MatchSupplementEntry(db::Repository& repo, db::Transaction& tx,
                                                                     const db::model::SupplementEntryRecord& incoming);

} // namespace nutrition::backup
