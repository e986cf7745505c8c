#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/geometry.hpp"
#include "internal/model/source_identity.hpp"

namespace mc3d::db {

// extras keys written by the curation stages
inline constexpr const char* kExtraCifSpacegroupNumber = "cif_spacegroup_number";
inline constexpr const char* kExtraSpacegroupNumber    = "spacegroup_number";
inline constexpr const char* kExtraPartialOccupancies  = "partial_occupancies";
inline constexpr const char* kExtraIncorrectFormula    = "incorrect_formula";
inline constexpr const char* kExtraDuplicates          = "duplicates";

/*
  One stored crystal structure.

  formula and chemical_system are derived from the geometry at insert time
  and indexed; extras hold compact JSON values keyed by name.
*/
struct StructureRecord {
  std::string           uuid;
  model::SourceIdentity source;
  model::Geometry       geometry;

  // Hill-compact, e.g. "FeO"
  std::string formula;
  // "-Fe-O-"
  std::string chemical_system;

  std::vector<int>   cif_spacegroup_numbers;
  std::optional<int> exit_status;

  std::map<std::string, std::string> extras;
};

} // namespace mc3d::db
