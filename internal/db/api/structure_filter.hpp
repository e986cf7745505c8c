#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/structure_record.hpp"

namespace mc3d::db {

/*
  Structure query. Every set criterion must hold.
*/
struct StructureFilter {
  // member of any of these groups; empty = whole store
  std::vector<std::string> groups;

  // chemical system must contain every one of these
  std::vector<std::string> contains_elements;

  // ... and none of these
  std::vector<std::string> skip_elements;

  // drop structures carrying the incorrect_formula extra
  bool exclude_incorrect_formula = false;

  std::optional<std::string> database;

  // partial_occupancies extra must be present with this value
  std::optional<bool> partial_occupancies;

  std::optional<bool> contains_hydrogen;
};

// Everything except group membership, which backends resolve themselves.
bool MatchesAttributes(const StructureRecord& record, const StructureFilter& filter);

} // namespace mc3d::db
