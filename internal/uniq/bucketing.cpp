#include "internal/uniq/bucketing.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::uniq {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

std::string SortKey(const std::string& formula, const std::optional<int>& spacegroup_number) {
  if (!spacegroup_number) return formula;
  return formula + "|" + std::to_string(*spacegroup_number);
}

BucketingResult BucketStructures(const std::vector<model::CandidateStructure>& structures, bool sort_by_spacegroup,
                                 const matching::SymmetryDetector& detector, double symprec) {
  BucketingResult result;

  for (const auto& structure : structures) {
    if (structure.has_issue) {
      ++result.skipped_with_issue;
      continue;
    }

    std::optional<int> spacegroup;
    if (sort_by_spacegroup) {
      spacegroup = structure.spacegroup_number;
      if (!spacegroup) {
        try {
          if (!structure.geometry) {
            throw util::OracleFailure("no geometry available");
          }
          spacegroup = detector.SpaceGroupNumber(*structure.geometry, symprec);
        } catch (const std::exception& e) {
          const auto source = model::Format(structure.identity);
          MC3D_LOG_WARN("Space group detection failed", {StringField("source", source), StringField("error", e.what())});
          result.errors.push_back({source, e.what()});
          continue;
        }
      }
    }

    result.buckets[SortKey(structure.formula, spacegroup)].push_back(structure);
  }

  MC3D_LOG_INFO("Sorted structures into buckets", {IntField("structures", static_cast<int64_t>(structures.size())),
                                                   IntField("buckets", static_cast<int64_t>(result.buckets.size())),
                                                   IntField("skipped_with_issue", static_cast<int64_t>(result.skipped_with_issue)),
                                                   IntField("errors", static_cast<int64_t>(result.errors.size()))});
  return result;
}

} // namespace mc3d::uniq
