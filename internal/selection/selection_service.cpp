#include "internal/selection/selection_service.hpp"

#include <optional>

#include "internal/chem/formula.hpp"
#include "internal/db/source_index.hpp"
#include "internal/ledger/deprecation_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/selection/golden_selector.hpp"
#include "internal/uniq/checkpoint.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::selection {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

// The symmetry analysis stored on the structure, if any.
std::optional<int> StoredSpacegroup(const db::StructureRecord& record) {
  auto it = record.extras.find(db::kExtraSpacegroupNumber);
  if (it == record.extras.end()) return std::nullopt;

  const auto value = util::ParseJson(it->second);
  if (value.kind_case() == google::protobuf::Value::kNullValue) return std::nullopt;
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    throw util::FormatError(record.uuid + ": " + db::kExtraSpacegroupNumber + " is not a number");
  }
  return static_cast<int>(value.number_value());
}

} // namespace

SelectionOptions SelectionOptions::FromConfig(const mc3d::runtime::config::SelectionConfig& config) {
  SelectionOptions options;
  options.database_priority.assign(config.database_priority().begin(), config.database_priority().end());
  if (options.database_priority.empty()) options.database_priority = kDefaultDatabasePriority;
  if (!config.new_uniques_group().empty()) options.new_uniques_group = config.new_uniques_group();
  if (!config.selected_path().empty()) options.selected_path = config.selected_path();
  if (!config.new_data_path().empty()) options.new_data_path = config.new_data_path();
  return options;
}

SelectionService::SelectionService(db::StructureRepository& repository, const matching::SymmetryDetector& detector,
                                   SelectionOptions options)
    : repository_(repository), detector_(detector), options_(std::move(options)) {
  if (options_.database_priority.empty()) options_.database_priority = kDefaultDatabasePriority;
}

std::set<std::string> SelectionService::ExcludableSources() {
  db::StructureFilter filter;
  filter.database            = "cod";
  filter.partial_occupancies = false;
  filter.contains_hydrogen   = true;

  auto tx      = repository_.Begin();
  auto records = repository_.QueryStructures(*tx, filter);
  tx->Rollback();

  std::set<std::string> sources;
  for (const auto& record : records) sources.insert(model::Format(record.source));
  return sources;
}

SelectionOutcome SelectionService::Run(const std::filesystem::path& families_path,
                                       const std::filesystem::path& previous_records_path,
                                       const std::filesystem::path& ledger_path) {
  const auto families = uniq::LoadFamilies(families_path);
  const auto previous = model::LoadGoldenRecords(previous_records_path);
  const auto ledger   = ledger::DeprecationLedger::Load(ledger_path);

  MC3D_LOG_INFO("Loaded selection inputs", {IntField("families", static_cast<int64_t>(families.size())),
                                            IntField("previous_ids", static_cast<int64_t>(previous.size())),
                                            IntField("ledger_entries", static_cast<int64_t>(ledger.Size()))});

  {
    auto tx = repository_.Begin();
    if (repository_.GroupExists(*tx, options_.new_uniques_group)) {
      MC3D_LOG_ERROR("Group already exists", {StringField("group", options_.new_uniques_group)});
      throw util::AlreadyExists("group '" + options_.new_uniques_group + "' already exists");
    }
    tx->Rollback();
  }

  SelectionOutcome outcome;
  outcome.report = FamilyResolver::Resolve(families, ledger, previous, ExcludableSources());

  uniq::SaveFamilies(options_.selected_path, outcome.report.new_families);
  MC3D_LOG_INFO("Selected families written", {StringField("path", options_.selected_path.string()),
                                              IntField("families", static_cast<int64_t>(outcome.report.new_families.size()))});

  // ------------------------------------------------------------
  // Golden structures
  // ------------------------------------------------------------

  GoldenSelector selector(options_.database_priority);

  std::vector<std::pair<std::string, const model::Family*>> picks;
  picks.reserve(outcome.report.new_families.size());
  for (const auto& family : outcome.report.new_families) {
    picks.emplace_back(selector.Select(family), &family);
  }

  db::SourceIndex index(repository_, db::StructureFilter{});
  index.Rebuild();

  std::vector<std::pair<std::string, std::vector<std::string>>> duplicates;
  for (const auto& [golden, family] : picks) {
    const auto uuid = index.Require(golden);

    auto tx        = repository_.Begin();
    auto structure = repository_.GetStructure(*tx, uuid);
    tx->Rollback();
    if (!structure) {
      throw util::NotFound("structure " + uuid + " for " + golden + " disappeared");
    }

    model::GoldenFamilyRecord record;
    record.duplicate_family                 = *family;
    record.golden_structure.source          = model::Parse(golden);
    record.golden_structure.reduced_formula = chem::ReducedFormula(chem::CountElements(structure->geometry));
    record.golden_structure.uuid            = uuid;

    record.golden_structure.spglib_space_group = StoredSpacegroup(*structure);
    if (!record.golden_structure.spglib_space_group) {
      try {
        record.golden_structure.spglib_space_group = detector_.SpaceGroupNumber(structure->geometry, matching::kDefaultSymprec);
      } catch (const util::OracleFailure& e) {
        MC3D_LOG_WARN("Space group detection failed", {StringField("source", golden), StringField("error", e.what())});
      }
    }

    outcome.new_records.emplace(golden, std::move(record));
    duplicates.emplace_back(uuid, GoldenSelector::Duplicates(*family, golden));
  }

  model::SaveGoldenRecords(options_.new_data_path, outcome.new_records);
  MC3D_LOG_INFO("New golden records written", {StringField("path", options_.new_data_path.string()),
                                               IntField("records", static_cast<int64_t>(outcome.new_records.size()))});

  // ------------------------------------------------------------
  // Store
  // ------------------------------------------------------------

  auto tx = repository_.Begin();
  if (repository_.GroupExists(*tx, options_.new_uniques_group)) {
    throw util::AlreadyExists("group '" + options_.new_uniques_group + "' already exists");
  }

  std::vector<std::string> members;
  members.reserve(duplicates.size());
  for (const auto& [uuid, others] : duplicates) {
    db::ThrowIfError(repository_.SetExtra(*tx, uuid, db::kExtraDuplicates, util::ToJson(util::StringListValue(others))),
                     "set duplicates on " + uuid);
    members.push_back(uuid);
  }

  db::ThrowIfError(repository_.CreateGroup(*tx, options_.new_uniques_group), "create group " + options_.new_uniques_group);
  db::ThrowIfError(repository_.AddToGroup(*tx, options_.new_uniques_group, members), "add to group " + options_.new_uniques_group);
  tx->Commit();

  index.Invalidate();

  MC3D_LOG_INFO("New uniques stored", {StringField("group", options_.new_uniques_group),
                                       IntField("structures", static_cast<int64_t>(members.size()))});
  return outcome;
}

} // namespace mc3d::selection
