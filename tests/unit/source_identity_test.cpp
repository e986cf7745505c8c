#include "internal/model/source_identity.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <unordered_set>

#include "internal/model/deprecation.hpp"
#include "internal/model/geometry_codec.hpp"
#include "internal/model/golden_record.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace {

using mc3d::model::SourceIdentity;

void TestFormatParseAreInverse() {
  SourceIdentity identity{"cod", "176429", "1000007"};
  const auto     text = mc3d::model::Format(identity);
  assert(text == "cod|176429|1000007");
  assert(mc3d::model::Parse(text) == identity);

  // empty fields are legal, only the separator count matters
  auto empty = mc3d::model::Parse("||");
  assert(empty.database.empty() && empty.version.empty() && empty.id.empty());
}

void TestMalformedStringsAreRejected() {
  for (const char* text : {"cod|1", "cod|1|2|3", "cod"}) {
    bool threw = false;
    try {
      (void)mc3d::model::Parse(text);
    } catch (const mc3d::util::FormatError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestFromFieldsPrefersDatabase() {
  auto identity = mc3d::model::FromFields({{"database", "icsd"}, {"db_name", "Crystallography Open Database"},
                                           {"version", "2023.1"}, {"id", "42"}});
  assert(identity.database == "icsd");
  assert(identity.version == "2023.1");
  assert(identity.id == "42");
}

void TestFromFieldsTranslatesLegacyNames() {
  auto identity = mc3d::model::FromFields(
      {{"db_name", "Materials Platform for Data Science"}, {"version", "1.0"}, {"id", "S1"}});
  assert(identity.database == "mpds");

  assert(mc3d::model::LegacyDatabaseName("cod") == "Crystallography Open Database");
  assert(!mc3d::model::DatabaseFromLegacyName("Unknown DB"));
}

void TestFromFieldsErrors() {
  bool unknown = false;
  try {
    (void)mc3d::model::FromFields({{"db_name", "Some Other Database"}, {"version", "1"}, {"id", "1"}});
  } catch (const mc3d::util::UnknownDatabaseError&) {
    unknown = true;
  }
  assert(unknown);

  bool missing_database = false;
  try {
    (void)mc3d::model::FromFields({{"version", "1"}, {"id", "1"}});
  } catch (const mc3d::util::UnknownDatabaseError&) {
    missing_database = true;
  }
  assert(missing_database);

  bool missing_id = false;
  try {
    (void)mc3d::model::FromFields({{"database", "cod"}, {"version", "1"}});
  } catch (const mc3d::util::FormatError&) {
    missing_id = true;
  }
  assert(missing_id);
}

void TestIdentityIsHashable() {
  std::unordered_set<SourceIdentity> seen;
  seen.insert({"cod", "1", "100"});
  seen.insert({"cod", "1", "100"});
  seen.insert({"cod", "2", "100"});
  assert(seen.size() == 2);
}

void TestDeprecationReasons() {
  using mc3d::model::DeprecationReason;
  for (auto reason : {DeprecationReason::kIdRemoved, DeprecationReason::kStructureUpdated,
                      DeprecationReason::kIncorrectFormula}) {
    assert(mc3d::model::ParseDeprecationReason(mc3d::model::ToString(reason)) == reason);
  }
  assert(mc3d::model::ToString(DeprecationReason::kIdRemoved) == "id_removed");
  assert(!mc3d::model::ParseDeprecationReason("vanished"));
}

void TestGeometryCodecDefaultsOccupancy() {
  auto value = mc3d::util::ParseJson(
      R"({"lattice": [[4, 0, 0], [0, 4, 0], [0, 0, 4]], "sites": [{"element": "Fe", "frac": [0, 0, 0]},
          {"element": "O", "frac": [0.5, 0.5, 0.5], "occupancy": 0.5}]})");
  auto geometry = mc3d::model::GeometryFromJson(value, "test");
  assert(geometry.lattice[1][1] == 4.0);
  assert(geometry.sites.size() == 2);
  assert(geometry.sites[0].occupancy == 1.0);
  assert(geometry.sites[1].occupancy == 0.5);
  assert(geometry.sites[1].frac[2] == 0.5);

  bool threw = false;
  try {
    (void)mc3d::model::GeometryFromJson(mc3d::util::ParseJson(R"({"lattice": [[1, 0, 0]], "sites": []})"), "bad");
  } catch (const mc3d::util::FormatError&) {
    threw = true;
  }
  assert(threw);
}

void TestGoldenRecordsSurviveAFile() {
  mc3d::model::GoldenRecordMap records;
  auto& record                              = records["mc3d-12"];
  record.duplicate_family                   = {"cod|1|100", "icsd|5|7"};
  record.golden_structure.source            = {"cod", "1", "100"};
  record.golden_structure.reduced_formula   = "NaCl";
  record.golden_structure.spglib_space_group = 225;
  record.golden_structure.uuid              = "00000000-0000-4000-8000-000000000001";

  auto& unknown_spg                    = records["icsd|2|9"];
  unknown_spg.duplicate_family         = {"icsd|2|9"};
  unknown_spg.golden_structure.source  = {"icsd", "2", "9"};
  unknown_spg.golden_structure.uuid    = "00000000-0000-4000-8000-000000000002";

  const auto dir = std::filesystem::temp_directory_path() / "mc3d_source_identity_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "golden.json";
  mc3d::model::SaveGoldenRecords(path, records);

  auto loaded = mc3d::model::LoadGoldenRecords(path);
  assert(loaded.size() == 2);
  assert(loaded.at("mc3d-12").golden_structure.source == (SourceIdentity{"cod", "1", "100"}));
  assert(loaded.at("mc3d-12").golden_structure.spglib_space_group == 225);
  assert(loaded.at("mc3d-12").duplicate_family.size() == 2);
  assert(!loaded.at("icsd|2|9").golden_structure.spglib_space_group);

  // atomic write leaves no temporary behind
  size_t files = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++files;
  }
  assert(files == 1);
}

} // namespace

int main() {
  TestFormatParseAreInverse();
  TestMalformedStringsAreRejected();
  TestFromFieldsPrefersDatabase();
  TestFromFieldsTranslatesLegacyNames();
  TestFromFieldsErrors();
  TestIdentityIsHashable();
  TestDeprecationReasons();
  TestGeometryCodecDefaultsOccupancy();
  TestGoldenRecordsSurviveAFile();

  std::cout << "mc3d_unit_source_identity: pass\n";
  return 0;
}
