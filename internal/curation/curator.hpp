#pragma once

#include <map>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"

namespace mc3d::curation {

// cif-clean exit code -> incorrect_formula extra value
inline const std::map<int, std::string> kIncorrectFormulaExitCodes = {
    {430, "missing_elements"},
    {431, "different_comp"},
    {432, "check_failes"},
};

std::optional<std::string> IncorrectFormulaReason(const std::optional<int>& exit_status);

struct CurationOutcome {
  size_t processed           = 0;
  size_t curated             = 0;
  size_t partial_occupancies = 0;
  size_t incorrect_formula   = 0;
};

/*
  Sets the curation extras on every structure of `import_group` and adds the
  clean ones (no partial occupancies, no formula issue) to `curated_group`.

  Extras:
    cif_spacegroup_number  when exactly one CIF space group is known
    partial_occupancies    always
    incorrect_formula      when the exit status maps to a formula issue

  One transaction.
*/
CurationOutcome Curate(db::StructureRepository& repository, const std::string& import_group,
                       const std::string& curated_group);

} // namespace mc3d::curation
