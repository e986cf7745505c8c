#pragma once

#include <string_view>
#include <vector>

#include "internal/matching/structure_matcher.hpp"
#include "internal/model/candidate.hpp"

namespace mc3d::uniq {

/*
  Clustering strategies over one bucket.

  All of them return a partition of the bucket's identity strings. Empty
  input gives an empty partition and a single structure gives one singleton
  family; neither calls the matcher.
*/
enum class Method {
  // Representatives in insertion order; a structure joins the first one it
  // fits. Cheap, but order dependent when similarity is not transitive.
  kFirstReference,

  // All pairs, connected components of the fit graph. Order independent.
  kGraph,

  // StructureMatcher::Group.
  kExhaustiveGrouping,
};

// Accepts the CLI names first|seb|pymatgen and first-reference|graph|exhaustive-grouping.
// Throws std::invalid_argument otherwise.
Method ParseMethod(std::string_view name);

std::string_view ToString(Method method);

using Bucket = std::vector<model::CandidateStructure>;

model::Partition ClusterFirstReference(const Bucket& bucket, const matching::StructureMatcher& matcher);
model::Partition ClusterGraph(const Bucket& bucket, const matching::StructureMatcher& matcher);
model::Partition ClusterExhaustiveGrouping(const Bucket& bucket, const matching::StructureMatcher& matcher);

model::Partition Cluster(Method method, const Bucket& bucket, const matching::StructureMatcher& matcher);

} // namespace mc3d::uniq
