#include "internal/model/nutrient_catalog.hpp"

#include <sstream>
#include <stdexcept>

namespace nutrition::model {

namespace {

constexpr auto kVitamin = NutrientCategory::kVitamin;
constexpr auto kMineral = NutrientCategory::kMineral;

// Targets are adult RDA/AI values, upper limits are tolerable upper intake levels.
const std::array<NutrientDefinition, kNutrientCount> kDefinitions = {{
    {NutrientId::kVitaminA, "vitaminA", "Vitamin A", "A", "mcg", 800, 3000, kVitamin, 1},
    {NutrientId::kVitaminC, "vitaminC", "Vitamin C", "C", "mg", 80, 2000, kVitamin, 1},
    {NutrientId::kVitaminD, "vitaminD", "Vitamin D", "D", "mcg", 10, 100, kVitamin, 1},
    {NutrientId::kVitaminE, "vitaminE", "Vitamin E", "E", "mg", 12, 540, kVitamin, 2},
    {NutrientId::kVitaminK, "vitaminK", "Vitamin K", "K", "mcg", 75, std::nullopt, kVitamin, 1},
    {NutrientId::kVitaminB1, "vitaminB1", "Vitamin B1 (Thiamin)", "B1", "mg", 1.1, std::nullopt, kVitamin, 3},
    {NutrientId::kVitaminB2, "vitaminB2", "Vitamin B2 (Riboflavin)", "B2", "mg", 1.4, std::nullopt, kVitamin, 3},
    {NutrientId::kVitaminB3, "vitaminB3", "Vitamin B3 (Niacin)", "B3", "mg", 16, 35, kVitamin, 1},
    {NutrientId::kVitaminB5, "vitaminB5", "Vitamin B5 (Pantothenic Acid)", "B5", "mg", 5, std::nullopt, kVitamin, 2},
    {NutrientId::kVitaminB6, "vitaminB6", "Vitamin B6", "B6", "mg", 1.4, 25, kVitamin, 2},
    {NutrientId::kVitaminB7, "vitaminB7", "Vitamin B7 (Biotin)", "B7", "mcg", 30, std::nullopt, kVitamin, 1},
    {NutrientId::kVitaminB12, "vitaminB12", "Vitamin B12", "B12", "mcg", 2.5, std::nullopt, kVitamin, 2},
    {NutrientId::kFolate, "folate", "Folate (B9)", "Folate", "mcg", 400, 1000, kVitamin, 1},
    {NutrientId::kCalcium, "calcium", "Calcium", "Calcium", "mg", 1000, 2500, kMineral, 0},
    {NutrientId::kIron, "iron", "Iron", "Iron", "mg", 14, 45, kMineral, 1},
    {NutrientId::kZinc, "zinc", "Zinc", "Zinc", "mg", 10, 25, kMineral, 1},
    {NutrientId::kMagnesium, "magnesium", "Magnesium", "Magnes.", "mg", 375, 400, kMineral, 0},
    {NutrientId::kPotassium, "potassium", "Potassium", "Potass.", "mg", 3500, 6000, kMineral, 0},
    {NutrientId::kPhosphorus, "phosphorus", "Phosphorus", "Phosph.", "mg", 700, 4000, kMineral, 0},
    {NutrientId::kSelenium, "selenium", "Selenium", "Selenium", "mcg", 55, 400, kMineral, 1},
    {NutrientId::kCopper, "copper", "Copper", "Copper", "mg", 1, 5, kMineral, 2},
    {NutrientId::kManganese, "manganese", "Manganese", "Mangan.", "mg", 2, 11, kMineral, 2},
    {NutrientId::kChromium, "chromium", "Chromium", "Chromium", "mcg", 35, std::nullopt, kMineral, 1},
    {NutrientId::kMolybdenum, "molybdenum", "Molybdenum", "Molyb.", "mcg", 45, 2000, kMineral, 1},
    {NutrientId::kIodine, "iodine", "Iodine", "Iodine", "mcg", 150, 1100, kMineral, 1},
    {NutrientId::kChloride, "chloride", "Chloride", "Chloride", "mg", 2300, 3600, kMineral, 0},
}};

std::vector<NutrientDefinition> ByCategory(NutrientCategory category) {
  std::vector<NutrientDefinition> out;
  for (const auto& def : kDefinitions) {
    if (def.category == category) out.push_back(def);
  }
  return out;
}

} // namespace

const std::array<NutrientDefinition, kNutrientCount>& NutrientCatalog::All() {
  return kDefinitions;
}

const NutrientDefinition& NutrientCatalog::Get(NutrientId id) {
  const auto index = static_cast<std::size_t>(id);
  if (index >= kDefinitions.size()) {
    throw std::out_of_range("unknown nutrient id " + std::to_string(index));
  }
  return kDefinitions[index];
}

std::optional<NutrientId> NutrientCatalog::Parse(std::string_view key) {
  for (const auto& def : kDefinitions) {
    if (def.key == key) return def.id;
  }
  return std::nullopt;
}

std::string_view NutrientCatalog::Key(NutrientId id) {
  return Get(id).key;
}

std::vector<NutrientDefinition> NutrientCatalog::Vitamins() {
  return ByCategory(kVitamin);
}

std::vector<NutrientDefinition> NutrientCatalog::Minerals() {
  return ByCategory(kMineral);
}

std::string NutrientCatalog::AiPromptSchema(std::string_view per_unit) {
  std::ostringstream out;
  bool first = true;
  for (const auto& def : kDefinitions) {
    if (!first) out << '\n';
    first = false;
    out << '"' << def.key << "\": number in " << def.unit << " (per " << per_unit << ") or null,";
  }
  return out.str();
}

} // namespace nutrition::model
