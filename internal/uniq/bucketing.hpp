#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/matching/symmetry_detector.hpp"
#include "internal/model/candidate.hpp"
#include "internal/uniq/strategy.hpp"

namespace mc3d::uniq {

// A structure left out of bucketing because its space group could not be determined.
struct BucketingError {
  std::string source;
  std::string message;
};

struct BucketingResult {
  // sort key -> structures in input order
  std::map<std::string, Bucket> buckets;

  std::vector<BucketingError> errors;

  size_t skipped_with_issue = 0;
};

// "FeO" or "FeO|225"
std::string SortKey(const std::string& formula, const std::optional<int>& spacegroup_number);

/*
  Shards candidates by formula and, optionally, space group.

  Recorded space groups are used as is; missing ones are computed with
  `detector` at `symprec`. A detector failure is recorded in `errors` and
  bucketing continues with the next structure.
*/
BucketingResult BucketStructures(const std::vector<model::CandidateStructure>& structures, bool sort_by_spacegroup,
                                 const matching::SymmetryDetector& detector, double symprec = matching::kDefaultSymprec);

} // namespace mc3d::uniq
