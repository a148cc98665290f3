#include "memory_repository.hpp"

#include "internal/util/strings.hpp"
#include "memory_tx.hpp"

namespace nutrition::db::memory {

namespace {

template <typename Record>
Result InsertInto(std::map<std::string, Record>& table, const Record& r) {
  if (table.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, r.id);
  table.emplace(r.id, r);
  return Result::Ok();
}

template <typename Record>
std::optional<Record> FindIn(const std::map<std::string, Record>& table, const std::string& id) {
  const auto it = table.find(id);
  if (it == table.end()) return std::nullopt;
  return it->second;
}

template <typename Record>
std::vector<Record> ValuesOf(const std::map<std::string, Record>& table) {
  std::vector<Record> out;
  out.reserve(table.size());
  for (const auto& [_, record] : table) {
    out.push_back(record);
  }
  return out;
}

template <typename Record>
Result UpdateIn(std::map<std::string, Record>& table, const Record& r) {
  auto it = table.find(r.id);
  if (it == table.end()) return Result::Err(ErrorCode::NotFound, r.id);
  it->second = r;
  return Result::Ok();
}

template <typename Record, typename Pred>
std::vector<Record> FilterIn(const std::map<std::string, Record>& table, Pred&& pred) {
  std::vector<Record> out;
  for (const auto& [_, record] : table) {
    if (pred(record)) out.push_back(record);
  }
  return out;
}

// Mirrors the sqlite foreign keys so both backends reject the same writes.
template <typename Parent>
bool ReferenceHolds(const std::map<std::string, Parent>& parents, const std::optional<std::string>& id) {
  return !id || parents.contains(*id);
}

template <typename State>
Result CheckReferences(const State& s, const model::FoodEntryRecord& r) {
  if (!ReferenceHolds(s.products, r.product_id) || !ReferenceHolds(s.daily_logs, r.daily_log_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed");
  }
  return Result::Ok();
}

template <typename State>
Result CheckReferences(const State& s, const model::SupplementEntryRecord& r) {
  if (!ReferenceHolds(s.supplements, r.supplement_id) || !ReferenceHolds(s.daily_logs, r.daily_log_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "FOREIGN KEY constraint failed");
  }
  return Result::Ok();
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Products
// ------------------------------------------------------------------

Result MemoryRepository::InsertProduct(Transaction& t, const model::ProductRecord& r) {
  return InsertInto(TX(t).Mutable().products, r);
}

std::optional<model::ProductRecord> MemoryRepository::GetProduct(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().products, id);
}

std::vector<model::ProductRecord> MemoryRepository::ListProducts(Transaction& t) {
  return ValuesOf(TX(t).View().products);
}

Result MemoryRepository::UpdateProduct(Transaction& t, const model::ProductRecord& r) {
  return UpdateIn(TX(t).Mutable().products, r);
}

Result MemoryRepository::DeleteProduct(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.products.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  // nullify, never cascade: entry snapshots stay valid
  for (auto& [_, entry] : s.food_entries) {
    if (entry.product_id == id) entry.product_id.reset();
  }
  return Result::Ok();
}

std::optional<model::ProductRecord> MemoryRepository::FindProductByBarcode(Transaction& t, const std::string& barcode) {
  for (const auto& [_, p] : TX(t).View().products) {
    if (p.barcode && *p.barcode == barcode) return p;
  }
  return std::nullopt;
}

std::optional<model::ProductRecord> MemoryRepository::FindProductByNameBrand(Transaction& t, const std::string& name,
                                                                             const std::optional<std::string>& brand) {
  for (const auto& [_, p] : TX(t).View().products) {
    if (p.name == name && p.brand == brand) return p;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Daily logs
// ------------------------------------------------------------------

Result MemoryRepository::InsertDailyLog(Transaction& t, const model::DailyLogRecord& r) {
  return InsertInto(TX(t).Mutable().daily_logs, r);
}

std::optional<model::DailyLogRecord> MemoryRepository::GetDailyLog(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().daily_logs, id);
}

std::vector<model::DailyLogRecord> MemoryRepository::ListDailyLogs(Transaction& t) {
  return ValuesOf(TX(t).View().daily_logs);
}

Result MemoryRepository::UpdateDailyLog(Transaction& t, const model::DailyLogRecord& r) {
  return UpdateIn(TX(t).Mutable().daily_logs, r);
}

Result MemoryRepository::DeleteDailyLog(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.daily_logs.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);

  std::erase_if(s.food_entries, [&](const auto& kv) { return kv.second.daily_log_id == id; });
  std::erase_if(s.supplement_entries, [&](const auto& kv) { return kv.second.daily_log_id == id; });
  return Result::Ok();
}

std::optional<model::DailyLogRecord> MemoryRepository::FindDailyLogInRange(Transaction& t, util::TimePoint from,
                                                                            util::TimePoint to) {
  for (const auto& [_, log] : TX(t).View().daily_logs) {
    if (log.date >= from && log.date < to) return log;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Food entries
// ------------------------------------------------------------------

Result MemoryRepository::InsertFoodEntry(Transaction& t, const model::FoodEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (auto check = CheckReferences(s, r); !check) return check;
  return InsertInto(s.food_entries, r);
}

std::optional<model::FoodEntryRecord> MemoryRepository::GetFoodEntry(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().food_entries, id);
}

std::vector<model::FoodEntryRecord> MemoryRepository::ListFoodEntries(Transaction& t) {
  return ValuesOf(TX(t).View().food_entries);
}

std::vector<model::FoodEntryRecord> MemoryRepository::ListFoodEntriesForLog(Transaction& t, const std::string& daily_log_id) {
  return FilterIn(TX(t).View().food_entries, [&](const auto& e) { return e.daily_log_id == daily_log_id; });
}

std::vector<model::FoodEntryRecord> MemoryRepository::ListFoodEntriesBetween(Transaction& t, util::TimePoint from,
                                                                             util::TimePoint to) {
  return FilterIn(TX(t).View().food_entries, [&](const auto& e) { return e.timestamp >= from && e.timestamp <= to; });
}

Result MemoryRepository::UpdateFoodEntry(Transaction& t, const model::FoodEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (auto check = CheckReferences(s, r); !check) return check;
  return UpdateIn(s.food_entries, r);
}

Result MemoryRepository::DeleteFoodEntry(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().food_entries.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// AI templates
// ------------------------------------------------------------------

Result MemoryRepository::InsertAiTemplate(Transaction& t, const model::AiTemplateRecord& r) {
  return InsertInto(TX(t).Mutable().ai_templates, r);
}

std::optional<model::AiTemplateRecord> MemoryRepository::GetAiTemplate(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().ai_templates, id);
}

std::vector<model::AiTemplateRecord> MemoryRepository::ListAiTemplates(Transaction& t) {
  return ValuesOf(TX(t).View().ai_templates);
}

Result MemoryRepository::UpdateAiTemplate(Transaction& t, const model::AiTemplateRecord& r) {
  return UpdateIn(TX(t).Mutable().ai_templates, r);
}

Result MemoryRepository::DeleteAiTemplate(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().ai_templates.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

std::optional<model::AiTemplateRecord> MemoryRepository::FindAiTemplateByName(Transaction& t, const std::string& name) {
  for (const auto& [_, tmpl] : TX(t).View().ai_templates) {
    if (util::EqualsIgnoreCase(tmpl.name, name)) return tmpl;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Supplements
// ------------------------------------------------------------------

Result MemoryRepository::InsertSupplement(Transaction& t, const model::SupplementRecord& r) {
  return InsertInto(TX(t).Mutable().supplements, r);
}

std::optional<model::SupplementRecord> MemoryRepository::GetSupplement(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().supplements, id);
}

std::vector<model::SupplementRecord> MemoryRepository::ListSupplements(Transaction& t) {
  return ValuesOf(TX(t).View().supplements);
}

Result MemoryRepository::UpdateSupplement(Transaction& t, const model::SupplementRecord& r) {
  return UpdateIn(TX(t).Mutable().supplements, r);
}

Result MemoryRepository::DeleteSupplement(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.supplements.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  for (auto& [_, entry] : s.supplement_entries) {
    if (entry.supplement_id == id) entry.supplement_id.reset();
  }
  return Result::Ok();
}

std::optional<model::SupplementRecord> MemoryRepository::FindSupplementByNameBrand(Transaction& t, const std::string& name,
                                                                                   const std::optional<std::string>& brand) {
  for (const auto& [_, s] : TX(t).View().supplements) {
    if (s.name == name && s.brand == brand) return s;
  }
  return std::nullopt;
}

// ------------------------------------------------------------------
// Supplement entries
// ------------------------------------------------------------------

Result MemoryRepository::InsertSupplementEntry(Transaction& t, const model::SupplementEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (auto check = CheckReferences(s, r); !check) return check;
  return InsertInto(s.supplement_entries, r);
}

std::optional<model::SupplementEntryRecord> MemoryRepository::GetSupplementEntry(Transaction& t, const std::string& id) {
  return FindIn(TX(t).View().supplement_entries, id);
}

std::vector<model::SupplementEntryRecord> MemoryRepository::ListSupplementEntries(Transaction& t) {
  return ValuesOf(TX(t).View().supplement_entries);
}

std::vector<model::SupplementEntryRecord> MemoryRepository::ListSupplementEntriesForLog(Transaction& t,
                                                                                       const std::string& daily_log_id) {
  return FilterIn(TX(t).View().supplement_entries, [&](const auto& e) { return e.daily_log_id == daily_log_id; });
}

std::vector<model::SupplementEntryRecord> MemoryRepository::ListSupplementEntriesBetween(Transaction& t, util::TimePoint from,
                                                                                         util::TimePoint to) {
  return FilterIn(TX(t).View().supplement_entries,
                  [&](const auto& e) { return e.timestamp >= from && e.timestamp <= to; });
}

Result MemoryRepository::UpdateSupplementEntry(Transaction& t, const model::SupplementEntryRecord& r) {
  auto& s = TX(t).Mutable();
  if (auto check = CheckReferences(s, r); !check) return check;
  return UpdateIn(s.supplement_entries, r);
}

Result MemoryRepository::DeleteSupplementEntry(Transaction& t, const std::string& id) {
  if (TX(t).Mutable().supplement_entries.erase(id) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

} // namespace nutrition::db::memory
