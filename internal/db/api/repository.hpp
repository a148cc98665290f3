#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/ai_template_record.hpp"
#include "internal/db/model/daily_log_record.hpp"
#include "internal/db/model/food_entry_record.hpp"
#include "internal/db/model/product_record.hpp"
#include "internal/db/model/supplement_entry_record.hpp"
#include "internal/db/model/supplement_record.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Deleting a product/supplement nullifies references from entries
  - Deleting a daily log deletes its food and supplement entries

  List* results are ordered by id so that callers (and backups) see the
  same order on every backend.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Products
  // ---------------------------------------------------------------------

  virtual Result InsertProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::ProductRecord> ListProducts(Transaction&) = 0;

  virtual Result UpdateProduct(Transaction&, const model::ProductRecord&) = 0;

  virtual Result DeleteProduct(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::ProductRecord> FindProductByBarcode(Transaction&, const std::string& barcode) = 0;

  // Exact name; brand compared as optional (absent matches absent only).
  virtual std::optional<model::ProductRecord> FindProductByNameBrand(Transaction&, const std::string& name,
                                                                     const std::optional<std::string>& brand) = 0;

  // ---------------------------------------------------------------------
  // Daily logs
  // ---------------------------------------------------------------------

  virtual Result InsertDailyLog(Transaction&, const model::DailyLogRecord&) = 0;

  virtual std::optional<model::DailyLogRecord> GetDailyLog(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::DailyLogRecord> ListDailyLogs(Transaction&) = 0;

  virtual Result UpdateDailyLog(Transaction&, const model::DailyLogRecord&) = 0;

  virtual Result DeleteDailyLog(Transaction&, const std::string& id) = 0;

  // First log whose date lies in [from, to).
  virtual std::optional<model::DailyLogRecord> FindDailyLogInRange(Transaction&, util::TimePoint from, util::TimePoint to) = 0;

  // ---------------------------------------------------------------------
  // Food entries
  // ---------------------------------------------------------------------

  virtual Result InsertFoodEntry(Transaction&, const model::FoodEntryRecord&) = 0;

  virtual std::optional<model::FoodEntryRecord> GetFoodEntry(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::FoodEntryRecord> ListFoodEntries(Transaction&) = 0;

  virtual std::vector<model::FoodEntryRecord> ListFoodEntriesForLog(Transaction&, const std::string& daily_log_id) = 0;

  // Entries with timestamp in [from, to] (inclusive both ends).
  virtual std::vector<model::FoodEntryRecord> ListFoodEntriesBetween(Transaction&, util::TimePoint from, util::TimePoint to) = 0;

  virtual Result UpdateFoodEntry(Transaction&, const model::FoodEntryRecord&) = 0;

  virtual Result DeleteFoodEntry(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // AI templates
  // ---------------------------------------------------------------------

  virtual Result InsertAiTemplate(Transaction&, const model::AiTemplateRecord&) = 0;

  virtual std::optional<model::AiTemplateRecord> GetAiTemplate(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::AiTemplateRecord> ListAiTemplates(Transaction&) = 0;

  virtual Result UpdateAiTemplate(Transaction&, const model::AiTemplateRecord&) = 0;

  virtual Result DeleteAiTemplate(Transaction&, const std::string& id) = 0;

  // Name match under Unicode case folding (util::FoldCase).
  virtual std::optional<model::AiTemplateRecord> FindAiTemplateByName(Transaction&, const std::string& name) = 0;

  // ---------------------------------------------------------------------
  // Supplements
  // ---------------------------------------------------------------------

  virtual Result InsertSupplement(Transaction&, const model::SupplementRecord&) = 0;

  virtual std::optional<model::SupplementRecord> GetSupplement(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SupplementRecord> ListSupplements(Transaction&) = 0;

  virtual Result UpdateSupplement(Transaction&, const model::SupplementRecord&) = 0;

  virtual Result DeleteSupplement(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::SupplementRecord> FindSupplementByNameBrand(Transaction&, const std::string& name,
                                                                           const std::optional<std::string>& brand) = 0;

  // ---------------------------------------------------------------------
  // Supplement entries
  // ---------------------------------------------------------------------

  virtual Result InsertSupplementEntry(Transaction&, const model::SupplementEntryRecord&) = 0;

  virtual std::optional<model::SupplementEntryRecord> GetSupplementEntry(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::SupplementEntryRecord> ListSupplementEntries(Transaction&) = 0;

  virtual std::vector<model::SupplementEntryRecord> ListSupplementEntriesForLog(Transaction&, const std::string& daily_log_id) = 0;

  virtual std::vector<model::SupplementEntryRecord> ListSupplementEntriesBetween(Transaction&, util::TimePoint from,
                                                                                 util::TimePoint to) = 0;

  virtual Result UpdateSupplementEntry(Transaction&, const model::SupplementEntryRecord&) = 0;

  virtual Result DeleteSupplementEntry(Transaction&, const std::string& id) = 0;
};

} // namespace nutrition::db
