#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/candidate.hpp"

namespace mc3d::curation {

struct CandidateQuery {
  std::vector<std::string> groups;
  std::vector<std::string> contains_elements;
  std::vector<std::string> skip_elements;
};

// cif_spacegroup_number extra, if recorded.
std::optional<int> RecordedSpacegroup(const db::StructureRecord& record);

model::CandidateStructure ToCandidate(const db::StructureRecord& record);

/*
  Structures of the given groups, minus those flagged incorrect_formula,
  narrowed by the element filters.

  Throws util::NotFound when a group is missing or nothing matches.
*/
std::vector<model::CandidateStructure> LoadCandidates(db::StructureRepository& repository, const CandidateQuery& query);

} // namespace mc3d::curation
