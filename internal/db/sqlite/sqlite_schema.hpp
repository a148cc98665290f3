#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace nutrition::db::sqlite {

/*
  Creates or upgrades the nutrition schema.

  Times are stored as int64 unix nanoseconds. Nutrient maps are stored as
  "key=value;key=value" text using catalog keys.

  food_entries.product_id and supplement_entries.supplement_id are
  ON DELETE SET NULL; entry -> daily_log is ON DELETE CASCADE.
*/
void BootstrapSchema(const std::shared_ptr<SqliteDB>& db);

} // namespace nutrition::db::sqlite
