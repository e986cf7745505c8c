#include "internal/curation/curator.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/curation/candidate_loader.hpp"
#include "internal/curation/record_importer.hpp"
#include "internal/curation/source_compare.hpp"
#include "internal/curation/updater.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/source_index.hpp"
#include "internal/matching/lattice_matcher.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace {

constexpr const char* kImportGroup  = "cod/2024/import";
constexpr const char* kCuratedGroup = "cod/2024/curated";

std::filesystem::path WriteRecords(const std::string& name, const std::string& json) {
  const auto dir = std::filesystem::temp_directory_path() / "mc3d_curation_tests";
  std::filesystem::create_directories(dir);

  const auto    path = dir / (name + ".json");
  std::ofstream out(path);
  out << json;
  out.close();
  return path;
}

// clean rock salt, a vacancy, a formula mismatch, a legacy ICSD record and one unusable record
const char* kRawRecords = R"([
  {"source": {"database": "cod", "version": "2024", "id": "1"},
   "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
   "sites": [{"element": "Na", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}],
   "cif_spacegroup_numbers": [225], "exit_status": 0},
  {"source": {"database": "cod", "version": "2024", "id": "2"},
   "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
   "sites": [{"element": "Na", "frac": [0, 0, 0], "occupancy": 0.7}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}]},
  {"source": {"database": "cod", "version": "2024", "id": "3"},
   "lattice": [[5, 0, 0], [0, 5, 0], [0, 0, 5]],
   "sites": [{"element": "K", "frac": [0, 0, 0]}, {"element": "Br", "frac": [0.5, 0.5, 0.5]}],
   "exit_status": 431},
  {"source": {"db_name": "Icsd", "version": 2024, "id": 7},
   "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
   "sites": [{"element": "Na", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}],
   "cif_spacegroup_numbers": [225, 221]},
  {"source": {"db_name": "Mystery Database", "version": "1", "id": "1"},
   "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
   "sites": [{"element": "Na", "frac": [0, 0, 0]}]}
])";

void ImportAndCurate(mc3d::db::StructureRepository& repo) {
  auto imported = mc3d::curation::ImportRecords(repo, WriteRecords("raw", kRawRecords), kImportGroup);
  assert(imported.imported == 4);
  assert(imported.errors.size() == 1);
  assert(imported.errors[0].index == 4);

  auto curated = mc3d::curation::Curate(repo, kImportGroup, kCuratedGroup);
  assert(curated.processed == 4);
  assert(curated.curated == 2);
  assert(curated.partial_occupancies == 1);
  assert(curated.incorrect_formula == 1);
}

// ------------------------------------------------------------
// Import / curate
// ------------------------------------------------------------

void TestRecordFromJsonDerivesFormula() {
  auto record = mc3d::curation::RecordFromJson(mc3d::util::ParseJson(
      R"({"source": {"db_name": "Crystallography Open Database", "version": "176429", "id": 1000007},
          "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
          "sites": [{"element": "Cl", "frac": [0.5, 0.5, 0.5]}, {"element": "Na", "frac": [0, 0, 0]}]})"));

  assert(mc3d::model::Format(record.source) == "cod|176429|1000007");
  assert(record.formula == "ClNa");
  assert(record.chemical_system == "-Cl-Na-");
  assert(record.cif_spacegroup_numbers.empty());
  assert(!record.exit_status);
}

void TestCurationExtrasAndGroups() {
  mc3d::db::memory::MemoryRepository repo;
  ImportAndCurate(repo);

  auto tx = repo.Begin();

  mc3d::db::StructureFilter all;
  all.groups = {kImportGroup};
  auto records = repo.QueryStructures(*tx, all);
  assert(records.size() == 4);

  // insertion order is kept
  assert(records[0].source.id == "1");
  assert(records[0].extras.at(mc3d::db::kExtraCifSpacegroupNumber) == "225");
  assert(records[0].extras.at(mc3d::db::kExtraPartialOccupancies) == "false");
  assert(!records[0].extras.contains(mc3d::db::kExtraIncorrectFormula));

  assert(records[1].extras.at(mc3d::db::kExtraPartialOccupancies) == "true");
  assert(records[2].extras.at(mc3d::db::kExtraIncorrectFormula) == "\"different_comp\"");

  // ambiguous CIF space groups are not recorded
  assert(records[3].source.database == "icsd");
  assert(!records[3].extras.contains(mc3d::db::kExtraCifSpacegroupNumber));

  assert(repo.GroupMembers(*tx, kCuratedGroup).size() == 2);
  tx->Rollback();

  assert(mc3d::curation::IncorrectFormulaReason(430) == "missing_elements");
  assert(!mc3d::curation::IncorrectFormulaReason(0));
  assert(!mc3d::curation::IncorrectFormulaReason(std::nullopt));
}

void TestCurateNeedsTheImportGroup() {
  mc3d::db::memory::MemoryRepository repo;

  bool threw = false;
  try {
    (void)mc3d::curation::Curate(repo, "missing", kCuratedGroup);
  } catch (const mc3d::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // the failed run left nothing behind
  auto tx = repo.Begin();
  assert(!repo.GroupExists(*tx, kCuratedGroup));
  tx->Rollback();
}

// ------------------------------------------------------------
// Candidates
// ------------------------------------------------------------

void TestCandidatesSkipIncorrectFormula() {
  mc3d::db::memory::MemoryRepository repo;
  ImportAndCurate(repo);

  auto candidates = mc3d::curation::LoadCandidates(repo, {{kImportGroup}, {}, {}});
  assert(candidates.size() == 3);
  assert(candidates[0].spacegroup_number == 225);
  assert(candidates[0].formula == "ClNa");
  assert(!candidates[1].spacegroup_number);

  auto curated = mc3d::curation::LoadCandidates(repo, {{kCuratedGroup}, {"Na"}, {}});
  assert(curated.size() == 2);

  bool none_left = false;
  try {
    (void)mc3d::curation::LoadCandidates(repo, {{kCuratedGroup}, {}, {"Cl"}});
  } catch (const mc3d::util::NotFound&) {
    none_left = true;
  }
  assert(none_left);

  bool no_groups = false;
  try {
    (void)mc3d::curation::LoadCandidates(repo, {});
  } catch (const std::invalid_argument&) {
    no_groups = true;
  }
  assert(no_groups);
}

// ------------------------------------------------------------
// Update
// ------------------------------------------------------------

void TestUpdateKeepsMatchingOldStructures() {
  mc3d::db::memory::MemoryRepository repo;

  mc3d::curation::ImportRecords(repo, WriteRecords("old", R"([
    {"source": {"database": "cod", "version": "1", "id": "1"},
     "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
     "sites": [{"element": "Na", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}]},
    {"source": {"database": "cod", "version": "1", "id": "2"},
     "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
     "sites": [{"element": "K", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}]}
  ])"),
                                "cod/1");

  mc3d::curation::ImportRecords(repo, WriteRecords("new", R"([
    {"source": {"database": "cod", "version": "2", "id": "1"},
     "lattice": [[4.05, 0, 0], [0, 4.05, 0], [0, 0, 4.05]],
     "sites": [{"element": "Na", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}]},
    {"source": {"database": "cod", "version": "2", "id": "2"},
     "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 7]],
     "sites": [{"element": "K", "frac": [0, 0, 0]}, {"element": "Cl", "frac": [0.5, 0.5, 0.5]}]},
    {"source": {"database": "cod", "version": "2", "id": "3"},
     "lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]],
     "sites": [{"element": "Li", "frac": [0, 0, 0]}, {"element": "F", "frac": [0.5, 0.5, 0.5]}]}
  ])"),
                                "cod/2");

  mc3d::matching::LatticeMatcher matcher;

  auto outcome = mc3d::curation::Update(repo, matcher, "cod/1", "cod/2", "cod/latest");
  assert(outcome.kept_old == 1);
  assert(outcome.updated == 1);
  assert(outcome.added == 1);
  assert(outcome.skipped == 0);

  auto tx = repo.Begin();
  mc3d::db::StructureFilter latest;
  latest.groups = {"cod/latest"};
  std::set<std::string> sources;
  for (const auto& record : repo.QueryStructures(*tx, latest)) sources.insert(mc3d::model::Format(record.source));
  tx->Rollback();
  assert((sources == std::set<std::string>{"cod|1|1", "cod|2|2", "cod|2|3"}));

  // a second pass finds every id in the target already
  auto again = mc3d::curation::Update(repo, matcher, "cod/1", "cod/2", "cod/latest");
  assert(again.skipped == 3);
  assert(again.kept_old + again.updated + again.added == 0);
}

// ------------------------------------------------------------
// Compare
// ------------------------------------------------------------

void TestCompareSources() {
  mc3d::db::memory::MemoryRepository repo;
  // no curation: both space groups come from the detector
  mc3d::curation::ImportRecords(repo, WriteRecords("compare", kRawRecords), kImportGroup);

  mc3d::matching::LatticeSymmetryDetector detector;
  mc3d::db::SourceIndex                   index(repo, mc3d::db::StructureFilter{});

  assert(mc3d::curation::CompareSources(index, repo, detector, "cod|2024|1", "icsd|2024|7"));
  assert(!mc3d::curation::CompareSources(index, repo, detector, "cod|2024|1", "cod|2024|3"));

  bool threw = false;
  try {
    (void)mc3d::curation::CompareSources(index, repo, detector, "cod|2024|1", "cod|2024|404");
  } catch (const mc3d::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRecordFromJsonDerivesFormula();
  TestCurationExtrasAndGroups();
  TestCurateNeedsTheImportGroup();
  TestCandidatesSkipIncorrectFormula();
  TestUpdateKeepsMatchingOldStructures();
  TestCompareSources();

  std::cout << "mc3d_unit_curation: pass\n";
  return 0;
}
