#include "internal/db/api/structure_filter.hpp"

namespace mc3d::db {

namespace {

bool HasElement(const std::string& chemical_system, const std::string& element) {
  return chemical_system.find("-" + element + "-") != std::string::npos;
}

} // namespace

bool MatchesAttributes(const StructureRecord& record, const StructureFilter& filter) {
  for (const auto& element : filter.contains_elements) {
    if (!HasElement(record.chemical_system, element)) return false;
  }
  for (const auto& element : filter.skip_elements) {
    if (HasElement(record.chemical_system, element)) return false;
  }

  if (filter.exclude_incorrect_formula && record.extras.contains(kExtraIncorrectFormula)) {
    return false;
  }

  if (filter.database && record.source.database != *filter.database) {
    return false;
  }

  if (filter.partial_occupancies) {
    auto it = record.extras.find(kExtraPartialOccupancies);
    if (it == record.extras.end()) return false;
    if (it->second != (*filter.partial_occupancies ? "true" : "false")) return false;
  }

  if (filter.contains_hydrogen && HasElement(record.chemical_system, "H") != *filter.contains_hydrogen) {
    return false;
  }

  return true;
}

} // namespace mc3d::db
