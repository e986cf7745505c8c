#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/source_index.hpp"
#include "internal/util/errors.hpp"

#if MC3D_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using mc3d::db::ErrorCode;
using mc3d::db::StructureFilter;
using mc3d::db::StructureRecord;
using mc3d::db::StructureRepository;
using mc3d::db::memory::MemoryRepository;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                                name;
  std::function<std::shared_ptr<StructureRepository>()>      make_repository;
  std::function<bool()>                                      supports_restart;
  std::function<void(std::shared_ptr<StructureRepository>&)> restart;
  std::function<void()>                                      cleanup;
  bool                                                       supports_parallel_transactions = true;
};

StructureRecord MakeRecord(const std::string& uuid, const std::string& source, const std::string& chemical_system) {
  StructureRecord record;
  record.uuid             = uuid;
  record.source           = mc3d::model::Parse(source);
  record.formula          = "ClNa";
  record.chemical_system  = chemical_system;
  record.geometry.lattice = {{{4, 0, 0}, {0, 4, 0}, {0, 0, 4}}};
  record.geometry.sites   = {{"Na", {0, 0, 0}}, {"Cl", {0.5, 0.5, 0.5}, 0.75}};
  record.cif_spacegroup_numbers = {225};
  record.exit_status            = 0;
  return record;
}

void VerifyInsertGetQuery(StructureRepository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto first  = MakeRecord(prefix + "-1", "cod|1|" + prefix + "1", "-Cl-Na-");
  auto second = MakeRecord(prefix + "-2", "mpds|1|" + prefix + "2", "-H-O-");
  second.extras[mc3d::db::kExtraPartialOccupancies] = "false";
  second.exit_status.reset();

  assert(repo.InsertStructure(*tx, first));
  assert(repo.InsertStructure(*tx, second));

  auto duplicate = repo.InsertStructure(*tx, first);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetStructure(*tx, first.uuid);
  assert(loaded.has_value());
  assert(loaded->source == first.source);
  assert(loaded->formula == "ClNa");
  assert(loaded->geometry.sites.size() == 2);
  assert(loaded->geometry.sites[1].occupancy == 0.75);
  assert(loaded->geometry.lattice[2][2] == 4.0);
  assert((loaded->cif_spacegroup_numbers == std::vector<int>{225}));
  assert(loaded->exit_status == 0);

  auto other = repo.GetStructure(*tx, second.uuid);
  assert(other.has_value());
  assert(!other->exit_status);
  assert(other->extras.at(mc3d::db::kExtraPartialOccupancies) == "false");

  assert(!repo.GetStructure(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyCurationColumnsRoundTrip(StructureRepository& repo, const std::string& prefix) {
  auto ambiguous = MakeRecord(prefix + "-spg", "icsd|2|" + prefix + "spg", "-Cl-Na-");
  ambiguous.cif_spacegroup_numbers = {225, 221, 1};
  ambiguous.exit_status            = 431;

  auto bare = MakeRecord(prefix + "-bare", "icsd|2|" + prefix + "bare", "-Cl-Na-");
  bare.cif_spacegroup_numbers.clear();
  bare.exit_status.reset();

  {
    auto tx = repo.Begin();
    assert(repo.InsertStructure(*tx, ambiguous));
    assert(repo.InsertStructure(*tx, bare));
    tx->Commit();
  }

  // read back in a fresh transaction, by uuid and through a query
  auto tx     = repo.Begin();
  auto loaded = repo.GetStructure(*tx, ambiguous.uuid);
  assert(loaded.has_value());
  assert((loaded->cif_spacegroup_numbers == std::vector<int>{225, 221, 1}));
  assert(loaded->exit_status == 431);

  auto empty = repo.GetStructure(*tx, bare.uuid);
  assert(empty.has_value());
  assert(empty->cif_spacegroup_numbers.empty());
  assert(!empty->exit_status);

  StructureFilter icsd;
  icsd.database = "icsd";
  size_t seen   = 0;
  for (const auto& record : repo.QueryStructures(*tx, icsd)) {
    if (record.uuid == ambiguous.uuid) {
      assert((record.cif_spacegroup_numbers == std::vector<int>{225, 221, 1}));
      assert(record.exit_status == 431);
      ++seen;
    } else if (record.uuid == bare.uuid) {
      assert(record.cif_spacegroup_numbers.empty());
      ++seen;
    }
  }
  assert(seen == 2);
  tx->Commit();
}

void VerifyFilters(StructureRepository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  StructureFilter hydrogen;
  hydrogen.contains_hydrogen = true;
  hydrogen.database          = "mpds";
  auto with_h                = repo.QueryStructures(*tx, hydrogen);
  bool found                 = false;
  for (const auto& record : with_h) found = found || record.uuid == prefix + "-2";
  assert(found);

  StructureFilter partial;
  partial.partial_occupancies = false;
  for (const auto& record : repo.QueryStructures(*tx, partial)) {
    assert(record.extras.at(mc3d::db::kExtraPartialOccupancies) == "false");
  }

  StructureFilter skip;
  skip.skip_elements = {"H"};
  for (const auto& record : repo.QueryStructures(*tx, skip)) {
    assert(record.chemical_system.find("-H-") == std::string::npos);
  }

  // symbols match whole: "He" does not satisfy "H"
  assert(repo.InsertStructure(*tx, MakeRecord(prefix + "-he", "cod|1|" + prefix + "he", "-He-")));
  StructureFilter only_h;
  only_h.contains_elements = {"H"};
  for (const auto& record : repo.QueryStructures(*tx, only_h)) {
    assert(record.uuid != prefix + "-he");
  }

  assert(repo.SetExtra(*tx, prefix + "-he", mc3d::db::kExtraIncorrectFormula, "\"missing_elements\""));
  StructureFilter clean;
  clean.exclude_incorrect_formula = true;
  for (const auto& record : repo.QueryStructures(*tx, clean)) {
    assert(record.uuid != prefix + "-he");
  }

  auto missing = repo.SetExtra(*tx, prefix + "-missing", "key", "1");
  assert(missing.code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyGroups(StructureRepository& repo, const std::string& prefix) {
  const auto label = prefix + "/group";
  auto       tx    = repo.Begin();

  assert(!repo.GroupExists(*tx, label));
  assert(repo.CreateGroup(*tx, label));
  assert(repo.CreateGroup(*tx, label).code == ErrorCode::AlreadyExists);
  assert(repo.GroupExists(*tx, label));

  assert(repo.AddToGroup(*tx, label, {prefix + "-2", prefix + "-1"}));
  // re-adding is a no-op
  assert(repo.AddToGroup(*tx, label, {prefix + "-1"}));
  assert(repo.AddToGroup(*tx, label, {prefix + "-missing"}).code == ErrorCode::NotFound);
  assert(repo.AddToGroup(*tx, prefix + "/nope", {prefix + "-1"}).code == ErrorCode::NotFound);

  auto members = repo.GroupMembers(*tx, label);
  assert((members == std::vector<std::string>{prefix + "-2", prefix + "-1"}));

  // query results follow insertion order, not group order
  StructureFilter in_group;
  in_group.groups = {label};
  auto records    = repo.QueryStructures(*tx, in_group);
  assert(records.size() == 2);
  assert(records[0].uuid == prefix + "-1");
  assert(records[1].uuid == prefix + "-2");
  tx->Commit();
}

void VerifyRollbackBehavior(StructureRepository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertStructure(*tx, MakeRecord(prefix + "-rolled", "cod|9|" + prefix, "-Cl-Na-")));
    assert(repo.CreateGroup(*tx, prefix + "/rolled"));
    tx->Rollback();
  }
  {
    // destructor rolls back as well
    auto tx = repo.Begin();
    assert(repo.InsertStructure(*tx, MakeRecord(prefix + "-dropped", "cod|9|" + prefix + "x", "-Cl-Na-")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetStructure(*tx, prefix + "-rolled").has_value());
  assert(!repo.GetStructure(*tx, prefix + "-dropped").has_value());
  assert(!repo.GroupExists(*tx, prefix + "/rolled"));
  tx->Commit();
}

void VerifyConcurrentCommits(StructureRepository& repo, const std::string& prefix, bool supports_parallel) {
  if (!supports_parallel) {
    return;
  }

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  assert(repo.CreateGroup(*tx1, prefix + "/a"));
  assert(repo.CreateGroup(*tx2, prefix + "/b"));
  tx1->Commit();

  bool threw = false;
  try {
    tx2->Commit();
  } catch (const mc3d::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  auto verify = repo.Begin();
  assert(repo.GroupExists(*verify, prefix + "/a"));
  assert(!repo.GroupExists(*verify, prefix + "/b"));
  verify->Commit();
}

void VerifySourceIndex(StructureRepository& repo, const std::string& prefix) {
  mc3d::db::SourceIndex index(repo, StructureFilter{});

  assert(index.Lookup("cod|1|" + prefix + "1") == prefix + "-1");
  assert(!index.Lookup("cod|1|unknown"));

  {
    auto tx = repo.Begin();
    assert(repo.InsertStructure(*tx, MakeRecord(prefix + "-late", "icsd|3|" + prefix, "-Cl-Na-")));
    tx->Commit();
  }
  // built before the insert
  assert(!index.Lookup("icsd|3|" + prefix));
  index.Invalidate();
  assert(index.Lookup(mc3d::model::SourceIdentity{"icsd", "3", prefix}) == prefix + "-late");

  bool threw = false;
  try {
    (void)index.Require("icsd|3|missing");
  } catch (const mc3d::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = MakeRecord(prefix + "-durable", "cod|7|" + prefix, "-Cl-Na-");
    record.extras[mc3d::db::kExtraDuplicates] = R"(["icsd|1|1"])";
    record.cif_spacegroup_numbers             = {62, 225};
    record.exit_status                        = 430;
    assert(repo->InsertStructure(*tx, record));
    assert(repo->CreateGroup(*tx, prefix + "/durable"));
    assert(repo->AddToGroup(*tx, prefix + "/durable", {record.uuid}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx     = repo->Begin();
  auto stored = repo->GetStructure(*tx, prefix + "-durable");
  assert(stored.has_value());
  assert(stored->extras.at(mc3d::db::kExtraDuplicates) == R"(["icsd|1|1"])");
  assert((stored->cif_spacegroup_numbers == std::vector<int>{62, 225}));
  assert(stored->exit_status == 430);
  assert(repo->GroupMembers(*tx, prefix + "/durable").size() == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<StructureRepository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if MC3D_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("mc3d_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<mc3d::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<mc3d::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<StructureRepository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() { std::filesystem::remove(db_path); },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertGetQuery(*repo, backend.name);
  VerifyCurationColumnsRoundTrip(*repo, backend.name);
  VerifyFilters(*repo, backend.name);
  VerifyGroups(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name);
  VerifyConcurrentCommits(*repo, backend.name, backend.supports_parallel_transactions);
  VerifySourceIndex(*repo, backend.name);

  repo.reset();
  VerifyRestartDurability(backend, backend.name);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if MC3D_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "mc3d_integration_repository_parity: pass\n";
  return 0;
}
