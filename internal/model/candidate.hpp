#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/geometry.hpp"
#include "internal/model/source_identity.hpp"

namespace mc3d::model {

/*
  A structure taking part in a uniqueness run.

  Built from a store query and never mutated afterwards. The geometry is
  shared so a candidate can be copied into buckets and worker tasks cheaply.
*/
struct CandidateStructure {
  SourceIdentity                  identity;
  std::shared_ptr<const Geometry> geometry;

  // Hill-compact formula, e.g. "FeO" or "C2H6O"
  std::string formula;

  std::optional<int> spacegroup_number;

  // excluded from clustering
  bool has_issue = false;
};

// Identity strings of structures considered identical.
using Family    = std::vector<std::string>;
using Partition = std::vector<Family>;

} // namespace mc3d::model
