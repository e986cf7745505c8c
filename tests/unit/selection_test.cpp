#include "internal/selection/selection_service.hpp"

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/selection/family_resolver.hpp"
#include "internal/selection/golden_selector.hpp"
#include "internal/uniq/checkpoint.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"
#include "internal/util/uuid.hpp"

namespace {

using mc3d::ledger::DeprecationLedger;
using mc3d::model::DeprecationReason;
using mc3d::model::GoldenRecordMap;
using mc3d::selection::FamilyResolver;
using mc3d::selection::GoldenSelector;

mc3d::model::GoldenFamilyRecord PreviousRecord(std::vector<std::string> family, const std::string& golden) {
  mc3d::model::GoldenFamilyRecord record;
  record.duplicate_family       = std::move(family);
  record.golden_structure.source = mc3d::model::Parse(golden);
  record.golden_structure.uuid   = mc3d::util::NewUuidString();
  return record;
}

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "mc3d_selection_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

// ------------------------------------------------------------
// GoldenSelector
// ------------------------------------------------------------

void TestGoldenFollowsPriority() {
  GoldenSelector selector;
  assert(selector.Select({"mpds|1|1", "icsd|1|1", "cod|1|100", "cod|1|101"}) == "cod|1|100");
  assert(selector.Select({"mpds|1|1", "icsd|1|9", "icsd|1|1"}) == "icsd|1|9");
  assert(selector.Select({"mpds|1|2"}) == "mpds|1|2");

  GoldenSelector icsd_first({"icsd", "cod"});
  assert(icsd_first.Select({"cod|1|100", "icsd|1|1"}) == "icsd|1|1");
}

void TestGoldenRequiresAPrioritisedDatabase() {
  bool threw = false;
  try {
    (void)GoldenSelector({"cod"}).Select({"mpds|1|1"});
  } catch (const mc3d::util::ConsistencyFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestDuplicatesExcludeGolden() {
  auto duplicates = GoldenSelector::Duplicates({"icsd|1|1", "cod|1|100", "cod|1|101"}, "cod|1|100");
  assert((duplicates == std::vector<std::string>{"icsd|1|1", "cod|1|101"}));
}

// ------------------------------------------------------------
// FamilyResolver
// ------------------------------------------------------------

void TestResolverCategories() {
  const mc3d::model::Partition families = {
      {"cod|1|100", "cod|1|101", "icsd|1|1"},  // 0
      {"mpds|1|1"},                            // 1
      {"mpds|1|2"},                            // 2
      {"cod|9|1"},                             // 3 excludable
      {"icsd|5|5"},                            // 4
  };

  GoldenRecordMap previous;
  previous["mc3d-1"] = PreviousRecord({"cod|1|100", "icsd|1|1"}, "cod|1|100");
  previous["mc3d-2"] = PreviousRecord({"mpds|1|1", "mpds|1|2"}, "mpds|1|1");
  previous["mc3d-3"] = PreviousRecord({"cod|0|7"}, "cod|0|7");
  previous["mc3d-4"] = PreviousRecord({"icsd|0|8"}, "icsd|0|8");
  previous["mc3d-5"] = PreviousRecord({"cod|1|101"}, "cod|1|101");

  DeprecationLedger ledger({{"cod|0|7", DeprecationReason::kIdRemoved}});

  auto report = FamilyResolver::Resolve(families, ledger, previous, {"cod|9|1"});

  assert(report.associated.at("mc3d-1") == 0);
  assert(report.associated.at("mc3d-5") == 0);
  assert((report.split.at("mc3d-2") == std::vector<size_t>{1, 2}));
  assert((report.deprecated == std::vector<std::string>{"mc3d-3"}));
  assert(report.orphaned.at("mc3d-4") == "icsd|0|8");

  assert(report.conflicts.size() == 1);
  assert(report.conflicts[0].family_index == 0);
  assert(report.conflicts[0].stable_ids.size() == 2);

  assert((report.excluded == std::vector<size_t>{3}));
  // the split part holding a golden source becomes a new family, the rest stays with mc3d-2
  assert((report.new_family_indices == std::vector<size_t>{1, 4}));
  assert(report.new_families.size() == 2);
  assert((report.new_families[0] == mc3d::model::Family{"mpds|1|1"}));
}

void TestSplitGoldenPartIsNew() {
  GoldenRecordMap previous;
  previous["mc3d-2"] = PreviousRecord({"mpds|1|1", "mpds|1|2"}, "mpds|1|1");

  auto report = FamilyResolver::Resolve({{"mpds|1|1"}, {"mpds|1|2"}}, DeprecationLedger(), previous, {});

  assert((report.split.at("mc3d-2") == std::vector<size_t>{0, 1}));
  assert(report.conflicts.empty());
  assert((report.new_family_indices == std::vector<size_t>{0}));
  assert(report.new_families.size() == 1);
  assert((report.new_families[0] == mc3d::model::Family{"mpds|1|1"}));
}

void TestDeprecatedSourceInPartitionIsFatal() {
  DeprecationLedger ledger({{"cod|1|100", DeprecationReason::kStructureUpdated}});

  bool threw = false;
  try {
    (void)FamilyResolver::Resolve({{"cod|1|100", "icsd|1|1"}}, ledger, {}, {});
  } catch (const mc3d::util::ConsistencyFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestFirstCycleMakesEveryFamilyNew() {
  auto report = FamilyResolver::Resolve({{"cod|1|1"}, {"icsd|1|2"}}, DeprecationLedger(), {}, {});
  assert(report.associated.empty());
  assert(report.new_families.size() == 2);
}

// ------------------------------------------------------------
// SelectionService
// ------------------------------------------------------------

struct Seeded {
  std::string source;
  std::string uuid;
};

Seeded Insert(mc3d::db::StructureRepository& repo, const std::string& source, const std::string& chemical_system,
              std::vector<mc3d::model::Site> sites, bool partial_occupancies = false) {
  auto tx = repo.Begin();

  mc3d::db::StructureRecord record;
  record.uuid             = mc3d::util::NewUuidString();
  record.source           = mc3d::model::Parse(source);
  record.chemical_system  = chemical_system;
  record.geometry.lattice = {{{4, 0, 0}, {0, 4, 0}, {0, 0, 4}}};
  record.geometry.sites   = std::move(sites);
  record.extras[mc3d::db::kExtraPartialOccupancies] = partial_occupancies ? "true" : "false";
  mc3d::db::ThrowIfError(repo.InsertStructure(*tx, record), "insert " + source);
  tx->Commit();

  return {source, record.uuid};
}

void TestSelectionServiceEndToEnd() {
  mc3d::db::memory::MemoryRepository      repo;
  mc3d::matching::LatticeSymmetryDetector detector;

  std::vector<mc3d::model::Site> iron_oxide = {{"Fe", {0, 0, 0}}, {"O", {0.5, 0.5, 0.5}}};
  std::vector<mc3d::model::Site> salt       = {{"Na", {0, 0, 0}}, {"Cl", {0.5, 0.5, 0.5}}};
  std::vector<mc3d::model::Site> ice        = {{"H", {0, 0, 0}}, {"O", {0.5, 0.5, 0.5}}};

  auto golden = Insert(repo, "cod|1|100", "-Fe-O-", iron_oxide);
  Insert(repo, "cod|1|101", "-Fe-O-", iron_oxide);
  Insert(repo, "icsd|1|1", "-Fe-O-", iron_oxide);
  auto salt_golden = Insert(repo, "mpds|1|1", "-Cl-Na-", salt);
  Insert(repo, "mpds|1|2", "-Cl-Na-", salt);
  Insert(repo, "cod|1|200", "-H-O-", ice);

  // a stored symmetry analysis wins over detection
  {
    auto tx = repo.Begin();
    mc3d::db::ThrowIfError(repo.SetExtra(*tx, salt_golden.uuid, mc3d::db::kExtraSpacegroupNumber, "225"), "set spg");
    tx->Commit();
  }

  const auto dir = FreshDir("end_to_end");
  mc3d::uniq::SaveFamilies(dir / "families.json",
                           {{"cod|1|100", "cod|1|101", "icsd|1|1"}, {"mpds|1|1"}, {"mpds|1|2"}, {"cod|1|200"}});
  mc3d::model::SaveGoldenRecords(dir / "previous.json", {});
  DeprecationLedger().Save(dir / "ledger.json");

  mc3d::selection::SelectionOptions options;
  options.database_priority = mc3d::selection::kDefaultDatabasePriority;
  options.selected_path     = dir / "selected.json";
  options.new_data_path     = dir / "new-data.json";

  mc3d::selection::SelectionService service(repo, detector, options);
  assert(service.ExcludableSources() == (std::set<std::string>{"cod|1|200"}));

  auto outcome = service.Run(dir / "families.json", dir / "previous.json", dir / "ledger.json");

  assert(outcome.report.excluded.size() == 1);
  assert(outcome.new_records.size() == 3);
  assert(mc3d::uniq::LoadFamilies(options.selected_path).size() == 3);

  const auto& record = outcome.new_records.at("cod|1|100");
  assert(record.golden_structure.uuid == golden.uuid);
  assert(record.golden_structure.reduced_formula == "FeO");
  assert(record.golden_structure.spglib_space_group == 221);
  assert(record.duplicate_family.size() == 3);

  // stored value used as is, no extra: detected from the cubic cell
  assert(outcome.new_records.at("mpds|1|1").golden_structure.spglib_space_group == 225);
  assert(outcome.new_records.at("mpds|1|2").golden_structure.spglib_space_group == 221);

  auto written = mc3d::model::LoadGoldenRecords(options.new_data_path);
  assert(written.size() == 3);
  assert(written.contains("mpds|1|2"));

  auto tx      = repo.Begin();
  auto members = repo.GroupMembers(*tx, options.new_uniques_group);
  assert(members.size() == 3);
  assert(std::find(members.begin(), members.end(), golden.uuid) != members.end());

  auto stored = repo.GetStructure(*tx, golden.uuid);
  assert(stored);
  auto duplicates = mc3d::util::ToStringList(mc3d::util::ParseJson(stored->extras.at(mc3d::db::kExtraDuplicates)), "duplicates");
  assert((duplicates == std::vector<std::string>{"cod|1|101", "icsd|1|1"}));
  tx->Rollback();

  // the new-uniques group is written once per cycle
  bool threw = false;
  try {
    (void)service.Run(dir / "families.json", dir / "previous.json", dir / "ledger.json");
  } catch (const mc3d::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownGoldenSourceIsNotFound() {
  mc3d::db::memory::MemoryRepository      repo;
  mc3d::matching::LatticeSymmetryDetector detector;

  const auto dir = FreshDir("unknown_source");
  mc3d::uniq::SaveFamilies(dir / "families.json", {{"cod|1|404"}});
  mc3d::model::SaveGoldenRecords(dir / "previous.json", {});
  DeprecationLedger().Save(dir / "ledger.json");

  mc3d::selection::SelectionOptions options;
  options.selected_path = dir / "selected.json";
  options.new_data_path = dir / "new-data.json";

  bool threw = false;
  try {
    (void)mc3d::selection::SelectionService(repo, detector, options)
        .Run(dir / "families.json", dir / "previous.json", dir / "ledger.json");
  } catch (const mc3d::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  // nothing reached the store
  auto tx = repo.Begin();
  assert(!repo.GroupExists(*tx, options.new_uniques_group));
  tx->Rollback();
}

} // namespace

int main() {
  TestGoldenFollowsPriority();
  TestGoldenRequiresAPrioritisedDatabase();
  TestDuplicatesExcludeGolden();
  TestResolverCategories();
  TestSplitGoldenPartIsNew();
  TestDeprecatedSourceInPartitionIsFatal();
  TestFirstCycleMakesEveryFamilyNew();
  TestSelectionServiceEndToEnd();
  TestUnknownGoldenSourceIsNotFound();

  std::cout << "mc3d_unit_selection: pass\n";
  return 0;
}
