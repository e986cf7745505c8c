#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/matching/structure_matcher.hpp"

namespace mc3d::curation {

struct UpdateOutcome {
  size_t kept_old = 0;  // old structure still fits the new one
  size_t updated  = 0;  // new structure differs, taken
  size_t added    = 0;  // id not known before
  size_t skipped  = 0;  // already in the target group
};

/*
  Builds the latest structure set of a database in `target_group`.

  Per database id in `new_group`: the old structure when the matcher fits it
  to the new one, otherwise the new structure. Ids already present in the
  target group are skipped. One transaction.
*/
UpdateOutcome Update(db::StructureRepository& repository, const matching::StructureMatcher& matcher,
                     const std::string& old_group, const std::string& new_group, const std::string& target_group);

} // namespace mc3d::curation
