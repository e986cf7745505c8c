#pragma once

#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/ledger/deprecation_ledger.hpp"

namespace mc3d::ledger {

/*
  Finds structures to deprecate by comparing store groups of two curation
  cycles. Read-only; results are merged into the ledger file by the caller.

  Source ids are compared per database: "cod|1|5" and "mpds|1|5" are
  unrelated records.
*/
class DeprecationAnalysis {
 public:
  explicit DeprecationAnalysis(db::StructureRepository& repository) : repository_(repository) {
  }

  // Old sources whose database id no longer appears in the new group.
  DeprecationLedger IdRemoved(const std::string& old_group, const std::string& new_group);

  // Old sources whose database id appears in the new group under another source string.
  DeprecationLedger StructureUpdated(const std::string& old_curated_group, const std::string& new_final_group);

  // Every structure carrying the incorrect_formula extra.
  DeprecationLedger IncorrectFormula();

 private:
  db::StructureRepository& repository_;
};

} // namespace mc3d::ledger
