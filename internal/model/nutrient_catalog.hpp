#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nutrition::model {

/*
  Vitamins and minerals tracked by the engine.

  Every nutrient value anywhere in the system is addressed by NutrientId.
  The string key ("vitaminA", "iron", ...) is the stable identifier used in
  AI-exchange JSON and in backup documents.
*/
enum class NutrientId : uint8_t {
  // vitamins
  kVitaminA,
  kVitaminC,
  kVitaminD,
  kVitaminE,
  kVitaminK,
  kVitaminB1,
  kVitaminB2,
  kVitaminB3,
  kVitaminB5,
  kVitaminB6,
  kVitaminB7,
  kVitaminB12,
  kFolate,
  // minerals
  kCalcium,
  kIron,
  kZinc,
  kMagnesium,
  kPotassium,
  kPhosphorus,
  kSelenium,
  kCopper,
  kManganese,
  kChromium,
  kMolybdenum,
  kIodine,
  kChloride,
};

inline constexpr std::size_t kNutrientCount = 26;

enum class NutrientCategory {
  kVitamin,
  kMineral,
};

struct NutrientDefinition {
  NutrientId            id;
  std::string_view      key;        // stable id, e.g. "vitaminA"
  std::string_view      name;       // "Vitamin A"
  std::string_view      short_name; // "A"
  std::string_view      unit;       // "mcg", "mg"
  double                target;     // recommended daily intake
  std::optional<double> upper_limit;
  NutrientCategory      category;
  int                   decimal_places;
};

/*
  Static registry. Pure lookup table, no state.
*/
class NutrientCatalog {
 public:
  // Catalog order: vitamins first, then minerals.
  static const std::array<NutrientDefinition, kNutrientCount>& All();

  static const NutrientDefinition& Get(NutrientId id);

  static std::optional<NutrientId> Parse(std::string_view key);

  static std::string_view Key(NutrientId id);

  static std::vector<NutrientDefinition> Vitamins();
  static std::vector<NutrientDefinition> Minerals();

  // JSON-schema lines describing the nutrient fields expected in an AI
  // estimate, one per nutrient, e.g.
  //   "vitaminA": number in mcg (per 100g) or null,
  static std::string AiPromptSchema(std::string_view per_unit = "100g");
};

} // namespace nutrition::model
