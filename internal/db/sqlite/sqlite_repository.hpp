#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace nutrition::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProduct(Transaction&, const model::ProductRecord&) override;
  std::optional<model::ProductRecord> GetProduct(Transaction&, const std::string&) override;
  std::vector<model::ProductRecord> ListProducts(Transaction&) override;
  Result UpdateProduct(Transaction&, const model::ProductRecord&) override;
  Result DeleteProduct(Transaction&, const std::string&) override;
  std::optional<model::ProductRecord> FindProductByBarcode(Transaction&, const std::string&) override;
  std::optional<model::ProductRecord> FindProductByNameBrand(Transaction&, const std::string&,
                                                             const std::optional<std::string>&) override;

  Result InsertDailyLog(Transaction&, const model::DailyLogRecord&) override;
  std::optional<model::DailyLogRecord> GetDailyLog(Transaction&, const std::string&) override;
  std::vector<model::DailyLogRecord> ListDailyLogs(Transaction&) override;
  Result UpdateDailyLog(Transaction&, const model::DailyLogRecord&) override;
  Result DeleteDailyLog(Transaction&, const std::string&) override;
  std::optional<model::DailyLogRecord> FindDailyLogInRange(Transaction&, util::TimePoint, util::TimePoint) override;

  Result InsertFoodEntry(Transaction&, const model::FoodEntryRecord&) override;
  std::optional<model::FoodEntryRecord> GetFoodEntry(Transaction&, const std::string&) override;
  std::vector<model::FoodEntryRecord> ListFoodEntries(Transaction&) override;
  std::vector<model::FoodEntryRecord> ListFoodEntriesForLog(Transaction&, const std::string&) override;
  std::vector<model::FoodEntryRecord> ListFoodEntriesBetween(Transaction&, util::TimePoint, util::TimePoint) override;
  Result UpdateFoodEntry(Transaction&, const model::FoodEntryRecord&) override;
  Result DeleteFoodEntry(Transaction&, const std::string&) override;

  Result InsertAiTemplate(Transaction&, const model::AiTemplateRecord&) override;
  std::optional<model::AiTemplateRecord> GetAiTemplate(Transaction&, const std::string&) override;
  std::vector<model::AiTemplateRecord> ListAiTemplates(Transaction&) override;
  Result UpdateAiTemplate(Transaction&, const model::AiTemplateRecord&) override;
  Result DeleteAiTemplate(Transaction&, const std::string&) override;
  std::optional<model::AiTemplateRecord> FindAiTemplateByName(Transaction&, const std::string&) override;

  Result InsertSupplement(Transaction&, const model::SupplementRecord&) override;
  std::optional<model::SupplementRecord> GetSupplement(Transaction&, const std::string&) override;
  std::vector<model::SupplementRecord> ListSupplements(Transaction&) override;
  Result UpdateSupplement(Transaction&, const model::SupplementRecord&) override;
  Result DeleteSupplement(Transaction&, const std::string&) override;
  std::optional<model::SupplementRecord> FindSupplementByNameBrand(Transaction&, const std::string&,
                                                                   const std::optional<std::string>&) override;

  Result InsertSupplementEntry(Transaction&, const model::SupplementEntryRecord&) override;
  std::optional<model::SupplementEntryRecord> GetSupplementEntry(Transaction&, const std::string&) override;
  std::vector<model::SupplementEntryRecord> ListSupplementEntries(Transaction&) override;
  std::vector<model::SupplementEntryRecord> ListSupplementEntriesForLog(Transaction&, const std::string&) override;
  std::vector<model::SupplementEntryRecord> ListSupplementEntriesBetween(Transaction&, util::TimePoint,
                                                                         util::TimePoint) override;
  Result UpdateSupplementEntry(Transaction&, const model::SupplementEntryRecord&) override;
  Result DeleteSupplementEntry(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
};

}
