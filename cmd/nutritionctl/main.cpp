#include <cstdio>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/nutrient_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using nutrition::model::NutrientCatalog;

static void Usage() {
  std::cout << "Usage:\n"
            << "  nutritionctl <config.yaml> export [out.json]\n"
            << "  nutritionctl <config.yaml> import <in.json>\n"
            << "  nutritionctl <config.yaml> summary <YYYY-MM-DD>\n"
            << "  nutritionctl <config.yaml> nutrients\n";
}

static std::string Format(double value, int decimals) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
  return buf;
}

static int RunCommand(nutrition::factory::Application& app, const std::string& cmd, int argc, char** argv) {
  // ------------------------------------------------------------

  if (cmd == "export") {
    if (argc >= 4) {
      app.backup_service->ExportToFile(argv[3]);
      std::cout << argv[3] << "\n";
    } else {
      std::cout << app.backup_service->ExportToFile().string() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "import") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto summary = app.backup_service->ImportFromFile(argv[3]);
    std::cout << summary.Summary() << "\n";
    if (auto skipped = summary.SkippedSummary(); !skipped.empty()) {
      std::cout << skipped << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "summary") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto day = nutrition::util::ParseLocalDate(argv[3]);
    if (!day) {
      std::cerr << "invalid date '" << argv[3] << "', expected YYYY-MM-DD\n";
      return 1;
    }

    const auto summary = app.store->GetDailySummary(*day);
    std::cout << "date=" << nutrition::util::FormatLocal(summary.log.date, "%Y-%m-%d") << "\n";
    std::cout << "calories=" << Format(summary.totals.calories, 0) << "/" << Format(summary.log.calorie_target, 0) << "\n";
    std::cout << "protein=" << Format(summary.totals.protein, 1) << "/" << Format(summary.log.protein_target, 0) << "\n";
    std::cout << "carbs=" << Format(summary.totals.carbohydrates, 1) << "/" << Format(summary.log.carb_target, 0) << "\n";
    std::cout << "fat=" << Format(summary.totals.fat, 1) << "/" << Format(summary.log.fat_target, 0) << "\n";
    std::cout << "remaining=" << Format(summary.calories_remaining, 0) << "\n";
    std::cout << "entries=" << summary.food_entry_count << " supplements=" << summary.supplement_entry_count << "\n";

    for (const auto& status : summary.nutrient_status) {
      const auto& def = NutrientCatalog::Get(status.id);
      std::cout << def.key << "=" << Format(status.amount, def.decimal_places) << def.unit << " ("
                << Format(status.percent_of_target, 0) << "%)" << (status.over_upper_limit ? " over upper limit" : "")
                << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "nutrients") {
    for (const auto& def : NutrientCatalog::All()) {
      std::cout << def.key << "\t" << def.name << "\t" << Format(def.target, def.decimal_places) << def.unit;
      if (def.upper_limit) {
        std::cout << "\tUL " << Format(*def.upper_limit, def.decimal_places) << def.unit;
      }
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    auto config = nutrition::config::ConfigLoader::LoadFromYaml(argv[1]);
    nutrition::observability::InitializeLogging(config);

    auto app = nutrition::factory::Build(config);
    const int rc = RunCommand(app, argv[2], argc, argv);

    app.backup_worker->Stop();
    nutrition::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    NUTRITION_LOG_ERROR("command failed", {nutrition::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    nutrition::observability::ShutdownLogging();
    return 2;
  }
}
