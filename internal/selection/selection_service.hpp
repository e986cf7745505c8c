#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/matching/symmetry_detector.hpp"
#include "internal/model/golden_record.hpp"
#include "internal/selection/family_resolver.hpp"

namespace mc3d::selection {

struct SelectionOptions {
  std::vector<std::string> database_priority;
  std::string              new_uniques_group = "global/uniques/new";
  std::filesystem::path    selected_path     = "selected-families.json";
  std::filesystem::path    new_data_path     = "new-mc3d-data.json";

  static SelectionOptions FromConfig(const mc3d::runtime::config::SelectionConfig& config);
};

struct SelectionOutcome {
  ResolutionReport      report;
  model::GoldenRecordMap new_records;
};

/*
  select stage:

      families + previous records + ledger
          → FamilyResolver → GoldenSelector
          → selected-families file, new golden-record file
          → one transaction: duplicates extras + new-uniques group

  Stops before touching the store when the new-uniques group already exists.
*/
class SelectionService {
 public:
  SelectionService(db::StructureRepository& repository, const matching::SymmetryDetector& detector,
                   SelectionOptions options);

  SelectionOutcome Run(const std::filesystem::path& families_path, const std::filesystem::path& previous_records_path,
                       const std::filesystem::path& ledger_path);

  // COD structures without partial occupancies whose chemical system contains H.
  std::set<std::string> ExcludableSources();

 private:
  db::StructureRepository&          repository_;
  const matching::SymmetryDetector& detector_;
  SelectionOptions                  options_;
};

} // namespace mc3d::selection
