#include "internal/model/nutrient_catalog.hpp"
#include "internal/model/nutrient_map.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using nutrition::model::NutrientCatalog;
using nutrition::model::NutrientCategory;
using nutrition::model::NutrientId;
using nutrition::model::NutrientMap;

void TestCatalogHasTwentySixUniqueKeys() {
  const auto& all = NutrientCatalog::All();
  assert(all.size() == 26);

  std::set<std::string> keys;
  for (const auto& def : all) {
    keys.insert(std::string(def.key));
    assert(def.target > 0);
    if (def.upper_limit) {
      assert(*def.upper_limit > def.target);
    }
  }
  assert(keys.size() == 26);

  assert(NutrientCatalog::Vitamins().size() == 13);
  assert(NutrientCatalog::Minerals().size() == 13);
  assert(NutrientCatalog::Vitamins().front().category == NutrientCategory::kVitamin);
}

void TestLookupByKey() {
  assert(NutrientCatalog::Parse("vitaminB12") == NutrientId::kVitaminB12);
  assert(NutrientCatalog::Parse("iron") == NutrientId::kIron);
  assert(!NutrientCatalog::Parse("VitaminB12").has_value());
  assert(!NutrientCatalog::Parse("").has_value());

  const auto& iron = NutrientCatalog::Get(NutrientId::kIron);
  assert(iron.unit == "mg");
  assert(iron.target == 14);
  assert(iron.upper_limit.has_value() && *iron.upper_limit == 45);

  assert(!NutrientCatalog::Get(NutrientId::kVitaminK).upper_limit.has_value());
  assert(NutrientCatalog::Key(NutrientId::kFolate) == "folate");
}

void TestPromptSchemaListsEveryNutrient() {
  const auto schema = NutrientCatalog::AiPromptSchema("serving");
  assert(schema.find("\"vitaminA\": number in mcg (per serving) or null,") != std::string::npos);
  assert(schema.find("\"chloride\": number in mg (per serving) or null,") != std::string::npos);

  std::size_t lines = 1;
  for (char c : schema) {
    if (c == '\n') ++lines;
  }
  assert(lines == 26);
}

void TestNutrientMapKeepsPresentZerosAndAbsence() {
  NutrientMap map;
  map.Set(NutrientId::kIron, 0.0);
  map.Set(NutrientId::kZinc, 4.0);
  map.Set(NutrientId::kCalcium, std::nullopt);

  auto scaled = map.Scaled(2.5);
  assert(scaled.Contains(NutrientId::kIron));
  assert(*scaled.Get(NutrientId::kIron) == 0.0);
  assert(*scaled.Get(NutrientId::kZinc) == 10.0);
  assert(!scaled.Contains(NutrientId::kCalcium));
  assert(scaled.size() == 2);

  NutrientMap total;
  total.Accumulate(scaled);
  total.Accumulate(map);
  assert(*total.Get(NutrientId::kZinc) == 14.0);
  assert(!total.Contains(NutrientId::kVitaminC));
}

} // namespace

int main() {
  TestCatalogHasTwentySixUniqueKeys();
  TestLookupByKey();
  TestPromptSchemaListsEveryNutrient();
  TestNutrientMapKeepsPresentZerosAndAbsence();

  std::cout << "nutrition_unit_nutrient_catalog: pass\n";
  return 0;
}
