#include "internal/factory.hpp"

#include <stdexcept>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/matching/lattice_matcher.hpp"
#include "internal/observability/logging.hpp"
#if MC3D_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace mc3d::factory {

using mc3d::observability::StringField;

std::shared_ptr<db::StructureRepository> BuildRepository(const mc3d::runtime::config::DatabaseConfig& config) {
  using Backend = mc3d::runtime::config::DatabaseConfig;

  switch (config.backend_case()) {
    case Backend::kMemory:
      MC3D_LOG_INFO("Using in-memory structure store");
      return std::make_shared<db::memory::MemoryRepository>();

    case Backend::kSqlite: {
#if MC3D_DB_SQLITE
      const auto& path = config.sqlite().path();
      if (path.empty()) {
        throw std::runtime_error("database.sqlite.path is required");
      }

      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path);
      sqlite_db->BootstrapSchema();

      MC3D_LOG_INFO("Using SQLite structure store", {StringField("path", path)});
      return std::make_shared<db::sqlite::SqliteRepository>(sqlite_db);
#else
      throw std::runtime_error("sqlite backend requested but not compiled in");
#endif
    }

    case Backend::BACKEND_NOT_SET:
      break;
  }

  throw std::runtime_error("database backend not configured");
}

std::shared_ptr<matching::StructureMatcher> BuildMatcher(const mc3d::runtime::config::MatcherConfig& config) {
  return std::make_shared<matching::LatticeMatcher>(matching::MatcherSettings::FromConfig(config));
}

RuntimeDependencies BuildRuntime(const mc3d::runtime::config::RuntimeConfig& config) {
  RuntimeDependencies deps;
  deps.repository = BuildRepository(config.database());
  deps.matcher    = BuildMatcher(config.matcher());
  deps.detector   = std::make_shared<matching::LatticeSymmetryDetector>();
  return deps;
}

} // namespace mc3d::factory
