#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/db/api/repository.hpp"

namespace mc3d::curation {

struct ImportError {
  size_t      index = 0;
  std::string message;
};

struct ImportOutcome {
  size_t                   imported = 0;
  std::vector<ImportError> errors;
};

/*
  Raw record (one element of the import file's JSON array):

    {
      "source": {"database": "cod", "version": "2024", "id": "1000001"},
      "lattice": [[...], [...], [...]],
      "sites": [{"element": "Na", "frac": [0, 0, 0]}, ...],
      "cif_spacegroup_numbers": [225],
      "exit_status": 0
    }

  "source" may carry the legacy "db_name" instead of "database".
  Throws util::FormatError / util::UnknownDatabaseError.
*/
db::StructureRecord RecordFromJson(const google::protobuf::Value& value);

/*
  Adds every valid record of `path` to the store and to `group` (created
  when missing), in one transaction. Invalid records are reported and
  skipped.
*/
ImportOutcome ImportRecords(db::StructureRepository& repository, const std::filesystem::path& path,
                            const std::string& group);

} // namespace mc3d::curation
