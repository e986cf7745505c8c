#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"

namespace mc3d::db::sqlite {

class SqliteRepository final : public db::StructureRepository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                         InsertStructure(Transaction&, const StructureRecord&) override;
  std::optional<StructureRecord> GetStructure(Transaction&, const std::string&) override;
  std::vector<StructureRecord>   QueryStructures(Transaction&, const StructureFilter&) override;
  Result                         SetExtra(Transaction&, const std::string& uuid, const std::string& key, const std::string& json) override;

  Result                   CreateGroup(Transaction&, const std::string& label) override;
  bool                     GroupExists(Transaction&, const std::string& label) override;
  Result                   AddToGroup(Transaction&, const std::string& label, const std::vector<std::string>& uuids) override;
  std::vector<std::string> GroupMembers(Transaction&, const std::string& label) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace mc3d::db::sqlite
