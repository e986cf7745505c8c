#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/matching/structure_matcher.hpp"
#include "internal/matching/symmetry_detector.hpp"

namespace mc3d::factory {

/*
  RuntimeDependencies

  Long-lived objects shared by every command of one process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::StructureRepository>    repository;
  std::shared_ptr<matching::StructureMatcher> matcher;
  std::shared_ptr<matching::SymmetryDetector> detector;
};

/*
  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
std::shared_ptr<db::StructureRepository> BuildRepository(const mc3d::runtime::config::DatabaseConfig& config);

std::shared_ptr<matching::StructureMatcher> BuildMatcher(const mc3d::runtime::config::MatcherConfig& config);

RuntimeDependencies BuildRuntime(const mc3d::runtime::config::RuntimeConfig& config);

} // namespace mc3d::factory
