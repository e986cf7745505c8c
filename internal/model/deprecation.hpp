#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mc3d::model {

enum class DeprecationReason {
  kIdRemoved,         // id no longer present in the source database
  kStructureUpdated,  // newer database version carries a different structure
  kIncorrectFormula,  // formula mismatch between cleaned CIF and parsed structure
};

// "id_removed" | "structure_updated" | "incorrect_formula"
std::string_view ToString(DeprecationReason reason);

std::optional<DeprecationReason> ParseDeprecationReason(std::string_view value);

std::string_view Describe(DeprecationReason reason);

} // namespace mc3d::model
