#include "internal/curation/curator.hpp"

#include "internal/chem/formula.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::curation {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

std::optional<std::string> IncorrectFormulaReason(const std::optional<int>& exit_status) {
  if (!exit_status) return std::nullopt;
  auto it = kIncorrectFormulaExitCodes.find(*exit_status);
  if (it == kIncorrectFormulaExitCodes.end()) return std::nullopt;
  return it->second;
}

CurationOutcome Curate(db::StructureRepository& repository, const std::string& import_group,
                       const std::string& curated_group) {
  auto tx = repository.Begin();
  if (!repository.GroupExists(*tx, import_group)) {
    throw util::NotFound("group '" + import_group + "' does not exist");
  }
  if (!repository.GroupExists(*tx, curated_group)) {
    db::ThrowIfError(repository.CreateGroup(*tx, curated_group), "create group " + curated_group);
    MC3D_LOG_INFO("Created group", {StringField("group", curated_group)});
  }

  db::StructureFilter filter;
  filter.groups = {import_group};

  const auto records = repository.QueryStructures(*tx, filter);
  MC3D_LOG_INFO("Curating structures", {StringField("group", import_group), IntField("structures", static_cast<int64_t>(records.size()))});

  CurationOutcome          outcome;
  std::vector<std::string> curated;

  for (const auto& record : records) {
    ++outcome.processed;

    if (record.cif_spacegroup_numbers.size() == 1) {
      db::ThrowIfError(repository.SetExtra(*tx, record.uuid, db::kExtraCifSpacegroupNumber,
                                           std::to_string(record.cif_spacegroup_numbers.front())),
                       "set extras on " + record.uuid);
    }

    const bool partial = chem::HasPartialOccupancies(record.geometry);
    db::ThrowIfError(repository.SetExtra(*tx, record.uuid, db::kExtraPartialOccupancies, partial ? "true" : "false"),
                     "set extras on " + record.uuid);
    if (partial) ++outcome.partial_occupancies;

    const auto reason = IncorrectFormulaReason(record.exit_status);
    if (reason) {
      db::ThrowIfError(repository.SetExtra(*tx, record.uuid, db::kExtraIncorrectFormula, util::ToJson(util::StringValue(*reason))),
                       "set extras on " + record.uuid);
      ++outcome.incorrect_formula;
    }

    if (!partial && !reason) curated.push_back(record.uuid);
  }

  db::ThrowIfError(repository.AddToGroup(*tx, curated_group, curated), "add to group " + curated_group);
  tx->Commit();

  outcome.curated = curated.size();
  MC3D_LOG_INFO("Curation finished", {StringField("curated_group", curated_group),
                                      IntField("processed", static_cast<int64_t>(outcome.processed)),
                                      IntField("curated", static_cast<int64_t>(outcome.curated)),
                                      IntField("partial_occupancies", static_cast<int64_t>(outcome.partial_occupancies)),
                                      IntField("incorrect_formula", static_cast<int64_t>(outcome.incorrect_formula))});
  return outcome;
}

} // namespace mc3d::curation
