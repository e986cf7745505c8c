#include "internal/model/deprecation.hpp"

namespace mc3d::model {

std::string_view ToString(DeprecationReason reason) {
  switch (reason) {
    case DeprecationReason::kIdRemoved:
      return "id_removed";
    case DeprecationReason::kStructureUpdated:
      return "structure_updated";
    case DeprecationReason::kIncorrectFormula:
      return "incorrect_formula";
  }
  return "unknown";
}

std::optional<DeprecationReason> ParseDeprecationReason(std::string_view value) {
  if (value == "id_removed") return DeprecationReason::kIdRemoved;
  if (value == "structure_updated") return DeprecationReason::kStructureUpdated;
  if (value == "incorrect_formula") return DeprecationReason::kIncorrectFormula;
  return std::nullopt;
}

std::string_view Describe(DeprecationReason reason) {
  switch (reason) {
    case DeprecationReason::kIdRemoved:
      return "The corresponding ID has been removed from the source database.";
    case DeprecationReason::kStructureUpdated:
      return "The corresponding ID has a different structure in a newer version of the database.";
    case DeprecationReason::kIncorrectFormula:
      return "The structure of the corresponding ID had a formula mismatch between the cleaned CIF and the parsed structure.";
  }
  return "";
}

} // namespace mc3d::model
