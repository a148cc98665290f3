#include "matching.hpp"

#include "internal/util/time.hpp"

namespace nutrition::backup {

using namespace nutrition::db::model;

namespace {

bool WithinTolerance(util::TimePoint a, util::TimePoint b) {
  const auto diff = a > b ? a - b : b - a;
  return diff <= kEntryTimestampTolerance;
}

} // namespace

std::optional<ProductRecord> MatchProduct(db::Repository& repo, db::Transaction& tx, const ProductRecord& incoming) {
  if (incoming.barcode && !incoming.barcode->empty()) {
    if (auto existing = repo.FindProductByBarcode(tx, *incoming.barcode)) return existing;
  }
  return repo.FindProductByNameBrand(tx, incoming.name, incoming.brand);
}

std::optional<DailyLogRecord> MatchDailyLog(db::Repository& repo, db::Transaction& tx, const DailyLogRecord& incoming) {
  const auto day_start = util::StartOfDay(incoming.date);
  return repo.FindDailyLogInRange(tx, day_start, util::StartOfNextDay(day_start));
}

bool SameFoodEntry(const FoodEntryRecord& existing, const FoodEntryRecord& incoming) {
  return WithinTolerance(existing.timestamp, incoming.timestamp) &&
         existing.snapshot.calories == incoming.snapshot.calories;
}

std::optional<FoodEntryRecord> MatchFoodEntry(db::Repository& repo, db::Transaction& tx, const FoodEntryRecord& incoming) {
  const auto candidates = repo.ListFoodEntriesBetween(tx, incoming.timestamp - kEntryTimestampTolerance,
                                                      incoming.timestamp + kEntryTimestampTolerance);
  for (const auto& existing : candidates) {
    if (SameFoodEntry(existing, incoming)) return existing;
  }
  return std::nullopt;
}

std::optional<AiTemplateRecord> MatchAiTemplate(db::Repository& repo, db::Transaction& tx, const AiTemplateRecord& incoming) {
  return repo.FindAiTemplateByName(tx, incoming.name);
}

std::optional<SupplementRecord> MatchSupplement(db::Repository& repo, db::Transaction& tx, const SupplementRecord& incoming) {
  return repo.FindSupplementByNameBrand(tx, incoming.name, incoming.brand);
}

bool SameSupplementEntry(const SupplementEntryRecord& existing, const SupplementEntryRecord& incoming) {
  return WithinTolerance(existing.timestamp, incoming.timestamp) && existing.supplement_name == incoming.supplement_name;
}

std::optional<SupplementEntryRecord> MatchSupplementEntry(db::Repository& repo, db::Transaction& tx,
                                                          const SupplementEntryRecord& incoming) {
  const auto candidates = repo.ListSupplementEntriesBetween(tx, incoming.timestamp - kEntryTimestampTolerance,
                                                            incoming.timestamp + kEntryTimestampTolerance);
  for (const auto& existing : candidates) {
    if (SameSupplementEntry(existing, incoming)) return existing;
  }
  return std::nullopt;
}

} // namespace nutrition::backup
