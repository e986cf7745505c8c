#pragma once

#include <string>

#include "internal/db/source_index.hpp"
#include "internal/matching/structure_matcher.hpp"
#include "internal/matching/symmetry_detector.hpp"

namespace mc3d::curation {

/*
  True when the structures behind two source strings fit with the default
  matcher tolerances scaled by `tol_factor` and have the same space group
  (recorded CIF space group, else detected at the default symprec).

  Throws util::NotFound for an unknown source.
*/
bool CompareSources(db::SourceIndex& index, db::StructureRepository& repository,
                    const matching::SymmetryDetector& detector, const std::string& reference,
                    const std::string& target, double tol_factor = 1.0);

} // namespace mc3d::curation
