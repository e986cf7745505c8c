#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/matching/structure_matcher.hpp"
#include "internal/uniq/uniqueness_engine.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "mc3d_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsAreApplied() {
  auto config = mc3d::config::ConfigLoader::Default();

  assert(config.uniq().method() == "first");
  assert(config.uniq().sort_by_spacegroup());
  assert(config.uniq().parallelize() == 5);
  assert(config.uniq().chunk_size() == 0);
  assert(config.uniq().checkpoint_path() == "checkpoint.json");
  assert(config.uniq().output_path() == "result.json");

  assert(config.matcher().ltol() == 0.2);
  assert(config.matcher().stol() == 0.3);
  assert(config.matcher().angle_tol() == 5.0);
  assert(config.matcher().scale());
  assert(!config.matcher().primitive_cell());

  assert(config.selection().database_priority_size() == 3);
  assert(config.selection().database_priority(0) == "cod");
  assert(config.selection().new_uniques_group() == "global/uniques/new");

  assert(config.database().has_sqlite());
}

void TestExplicitValuesSurviveDefaults() {
  const auto yaml_path = WriteYaml("explicit_values",
                                   R"(logging:
  level: debug
database:
  memory: {}
uniq:
  method: seb
  sort_by_spacegroup: false
  parallelize: 2
  chunk_size: 10
  checkpoint_path: "/tmp/run/checkpoint.json"
matcher:
  ltol: 0.1
  scale: false
selection:
  database_priority: [icsd, cod]
)");

  auto config = mc3d::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_memory());
  assert(config.uniq().method() == "seb");
  assert(!config.uniq().sort_by_spacegroup());
  assert(config.uniq().parallelize() == 2);
  assert(config.uniq().checkpoint_path() == "/tmp/run/checkpoint.json");
  assert(config.uniq().output_path() == "result.json");

  assert(config.matcher().ltol() == 0.1);
  assert(config.matcher().stol() == 0.3);
  assert(!config.matcher().scale());

  assert(config.selection().database_priority_size() == 2);
  assert(config.selection().database_priority(0) == "icsd");

  auto options = mc3d::uniq::UniquenessOptions::FromConfig(config.uniq());
  assert(options.method == mc3d::uniq::Method::kGraph);
  assert(!options.sort_by_spacegroup);
  assert(options.parallelize == 2);
  assert(options.chunk_size == 10);
}

void TestQuotedScalarsStayStrings() {
  const auto yaml_path = WriteYaml("quoted_scalars",
                                   R"(database:
  sqlite:
    path: "C:\\mc3d\\\"quoted\"\\db.sqlite"
)");

  auto config = mc3d::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\mc3d\\\"quoted\"\\db.sqlite");
}

void TestMatcherSettingsFile() {
  const auto yaml_path = WriteYaml("matcher_settings",
                                   R"(ltol: 0.3
stol: 0.5
angle_tol: 7
attempt_supercell: true
)");

  auto matcher  = mc3d::config::ConfigLoader::LoadMatcherSettings(yaml_path.string());
  auto settings = mc3d::matching::MatcherSettings::FromConfig(matcher);
  assert(settings.ltol == 0.3);
  assert(settings.stol == 0.5);
  assert(settings.angle_tol == 7.0);
  assert(settings.attempt_supercell);
  assert(settings.scale);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(uniq:
  method: first
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)mc3d::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)mc3d::config::ConfigLoader::LoadFromYaml("/nonexistent/mc3d/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestDefaultsAreApplied();
  TestExplicitValuesSurviveDefaults();
  TestQuotedScalarsStayStrings();
  TestMatcherSettingsFile();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "mc3d_unit_config_loader: pass\n";
  return 0;
}
