#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "nutrition_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
database:
  sqlite:
    path: "/var/lib/nutrition/store.db"
    wal_mode: true
scaling:
  max_direct_amount: 2000
  min_amount: 5
  treat_unknown_sugar_as_added: true
targets:
  calories: 2400
  protein: 140
  carbs: 300
  fat: 80
backup:
  directory: "/var/backups/nutrition"
  filename_prefix: "Nutrition_"
)");

  auto config = nutrition::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/nutrition/store.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.scaling().max_direct_amount() == 2000);
  assert(config.scaling().min_amount() == 5);
  assert(config.scaling().treat_unknown_sugar_as_added());
  assert(config.targets().calories() == 2400);
  assert(config.targets().fat() == 80);
  assert(config.backup().filename_prefix() == "Nutrition_");
}

void TestDefaultsFillGaps() {
  auto config = nutrition::config::ConfigLoader::LoadFromYamlString(R"(targets:
  calories: 1800
)");

  assert(config.logging().level() == "info");
  assert(config.database().has_memory());
  assert(config.scaling().max_direct_amount() == 5000);
  assert(config.scaling().min_amount() == 1);
  assert(!config.scaling().treat_unknown_sugar_as_added());
  assert(config.targets().calories() == 1800);
  assert(config.targets().protein() == 50);
  assert(config.targets().carbs() == 250);
  assert(config.targets().fat() == 65);
  assert(config.backup().filename_prefix() == "CalorieTracker_Backup_");

  const auto defaults = nutrition::config::ConfigLoader::Defaults();
  assert(defaults.database().has_memory());
  assert(defaults.targets().calories() == 2000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\nutrition\\\"quoted\"\\db.sqlite"
    wal_mode: false
)");

  auto config = nutrition::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\nutrition\\\"quoted\"\\db.sqlite");
  assert(!config.database().sqlite().wal_mode());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)nutrition::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestInconsistentScalingIsRejected() {
  bool threw = false;
  try {
    (void)nutrition::config::ConfigLoader::LoadFromYamlString(R"(scaling:
  max_direct_amount: 10
  min_amount: 50
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsFillGaps();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestInconsistentScalingIsRejected();

  std::cout << "nutrition_unit_config_loader: pass\n";
  return 0;
}
