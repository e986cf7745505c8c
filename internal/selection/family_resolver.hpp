#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/ledger/deprecation_ledger.hpp"
#include "internal/model/candidate.hpp"
#include "internal/model/golden_record.hpp"

namespace mc3d::selection {

// A new family claimed by several stable ids.
struct FamilyConflict {
  size_t                   family_index = 0;
  std::vector<std::string> stable_ids;
};

struct ResolutionReport {
  // stable id -> new family index it continues
  std::map<std::string, size_t> associated;

  // stable id -> every new family index its previous members ended up in (several)
  std::map<std::string, std::vector<size_t>> split;

  // every previous member is in the ledger
  std::vector<std::string> deprecated;

  // stable id -> previous golden source; lost its family without being deprecated
  std::map<std::string, std::string> orphaned;

  std::vector<FamilyConflict> conflicts;

  // new family indices dropped because every member is excludable
  std::vector<size_t> excluded;

  // indices of the families that get a new stable id, ascending
  std::vector<size_t> new_family_indices;
  model::Partition    new_families;
};

/*
  Maps a fresh partition onto the previous curation cycle.

      0. ledger keys must not appear in the partition (ConsistencyFailure)
      1. previous id -> new family indices: one = associated, none = deprecated
         when the whole previous family is in the ledger, orphaned otherwise
      2. several = split: indices without any previous golden source stay
         with the existing ids, indices holding one become new families
      3. families made only of excludable sources are dropped

  An index claimed by more than one stable id is reported as a conflict and
  stays with the existing ids.
*/
class FamilyResolver {
 public:
  static ResolutionReport Resolve(const model::Partition& families, const ledger::DeprecationLedger& ledger,
                                  const model::GoldenRecordMap& previous, const std::set<std::string>& excludable);
};

} // namespace mc3d::selection
