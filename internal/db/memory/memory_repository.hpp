#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mc3d::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::StructureRepository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                          InsertStructure(Transaction&, const StructureRecord&) override;
  std::optional<StructureRecord>  GetStructure(Transaction&, const std::string&) override;
  std::vector<StructureRecord>    QueryStructures(Transaction&, const StructureFilter&) override;
  Result                          SetExtra(Transaction&, const std::string& uuid, const std::string& key, const std::string& json) override;

  Result                   CreateGroup(Transaction&, const std::string& label) override;
  bool                     GroupExists(Transaction&, const std::string& label) override;
  Result                   AddToGroup(Transaction&, const std::string& label, const std::vector<std::string>& uuids) override;
  std::vector<std::string> GroupMembers(Transaction&, const std::string& label) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, StructureRecord> structures;
    std::vector<std::string>               insertion_order;

    std::map<std::string, std::vector<std::string>> groups;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace mc3d::db::memory
