#pragma once

#include <string>
#include <vector>

#include "internal/model/candidate.hpp"

namespace mc3d::selection {

inline const std::vector<std::string> kDefaultDatabasePriority = {"cod", "icsd", "mpds"};

/*
  Picks a family's representative by database priority.

  Lower index in the priority list wins; within one database the first
  member in family order wins.
*/
class GoldenSelector {
 public:
  explicit GoldenSelector(std::vector<std::string> database_priority = kDefaultDatabasePriority);

  // Throws util::ConsistencyFailure when no member comes from a prioritised database.
  std::string Select(const model::Family& family) const;

  // Family minus the representative, in family order.
  static std::vector<std::string> Duplicates(const model::Family& family, const std::string& golden);

 private:
  std::vector<std::string> priority_;
};

} // namespace mc3d::selection
