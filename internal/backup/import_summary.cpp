#include "import_summary.hpp"

#include <vector>

namespace nutrition::backup {

std::size_t ImportSummary::TotalImported() const {
  return products.imported + daily_logs.imported + food_entries.imported + ai_templates.imported +
         supplements.imported + supplement_entries.imported;
}

std::size_t ImportSummary::TotalSkipped() const {
  return products.skipped + daily_logs.skipped + food_entries.skipped + ai_templates.skipped + supplements.skipped +
         supplement_entries.skipped;
}

std::string ImportSummary::Summary() const {
  std::vector<std::string> parts;
  auto add = [&parts](std::size_t n, const char* noun) {
    if (n > 0) parts.push_back(std::to_string(n) + " " + noun);
  };
  add(products.imported, "products");
  add(daily_logs.imported, "days");
  add(food_entries.imported, "entries");
  add(ai_templates.imported, "templates");
  add(supplements.imported, "supplements");
  add(supplement_entries.imported, "supplement entries");

  if (parts.empty()) return "No new data imported (all items already exist)";

  std::string out = "Imported: ";
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += ", ";
    out += parts[i];
  }
  return out;
}

std::string ImportSummary::SkippedSummary() const {
  const auto total = TotalSkipped();
  if (total == 0) return {};
  return std::to_string(total) + " duplicate items skipped";
}

} // namespace nutrition::backup
