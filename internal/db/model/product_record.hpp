#pragma once

#include <optional>
#include <string>

#include "internal/model/nutrition_facts.hpp"
#include "internal/util/time.hpp"

namespace nutrition::db::model {

/*
  Product (nutrition reference) row.

  IMPORTANT:
  - per_100g is canonical: every value is for 100 g of product.
  - natural_sugar + added_sugar <= sugar when both are present. Not
    enforced by storage; aggregation assumes it.
  - Deleting a product nullifies product_id on its food entries. Their
    snapshots stay valid.
*/

struct ProductRecord {
  std::string id; // UUID

  std::string                name;
  std::optional<std::string> barcode;
  std::optional<std::string> brand;
  std::optional<std::string> emoji;

  // Label serving, informational only; nutrition is always per 100 g.
  double      serving_size      = 100;
  std::string serving_size_unit = "g";

  // Multi-portion products (e.g. 4 x 115 g pots).
  std::optional<double> portion_size;
  std::optional<int>    portions_per_package;

  nutrition::model::NutritionFacts per_100g;

  std::optional<std::string> image_data;      // raw bytes
  std::optional<std::string> main_image_data; // raw bytes
  std::optional<std::string> notes;

  bool                  is_custom = false;
  util::TimePoint       date_added{};

  bool operator==(const ProductRecord&) const = default;
};

} // namespace nutrition::db::model
