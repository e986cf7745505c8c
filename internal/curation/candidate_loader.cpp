#include "internal/curation/candidate_loader.hpp"

#include <memory>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::curation {

std::optional<int> RecordedSpacegroup(const db::StructureRecord& record) {
  auto it = record.extras.find(db::kExtraCifSpacegroupNumber);
  if (it == record.extras.end()) return std::nullopt;

  const auto value = util::ParseJson(it->second);
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    throw util::FormatError(record.uuid + ": cif_spacegroup_number is not a number");
  }
  return static_cast<int>(value.number_value());
}

model::CandidateStructure ToCandidate(const db::StructureRecord& record) {
  model::CandidateStructure candidate;
  candidate.identity          = record.source;
  candidate.geometry          = std::make_shared<const model::Geometry>(record.geometry);
  candidate.formula           = record.formula;
  candidate.spacegroup_number = RecordedSpacegroup(record);
  candidate.has_issue         = record.extras.contains(db::kExtraIncorrectFormula);
  return candidate;
}

std::vector<model::CandidateStructure> LoadCandidates(db::StructureRepository& repository, const CandidateQuery& query) {
  if (query.groups.empty()) {
    throw std::invalid_argument("at least one source group is required");
  }

  db::StructureFilter filter;
  filter.groups                    = query.groups;
  filter.contains_elements         = query.contains_elements;
  filter.skip_elements             = query.skip_elements;
  filter.exclude_incorrect_formula = true;

  auto tx = repository.Begin();
  for (const auto& group : query.groups) {
    if (!repository.GroupExists(*tx, group)) {
      throw util::NotFound("source group '" + group + "' does not exist");
    }
  }
  const auto records = repository.QueryStructures(*tx, filter);
  tx->Rollback();

  if (records.empty()) {
    throw util::NotFound("no structures in the source group(s) with the specified filters");
  }

  std::vector<model::CandidateStructure> candidates;
  candidates.reserve(records.size());
  for (const auto& record : records) {
    candidates.push_back(ToCandidate(record));
  }

  MC3D_LOG_INFO("Loaded candidate structures", {observability::IntField("structures", static_cast<int64_t>(candidates.size()))});
  return candidates;
}

} // namespace mc3d::curation
