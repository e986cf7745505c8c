#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/structure_filter.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/structure_record.hpp"

namespace mc3d::db {

/*
  Structure store abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - A finalize pass (curate, select, update) commits all of its writes or none

  The store is the source of truth for:
    structures and their extras
    group membership
*/

class StructureRepository {
 public:
  virtual ~StructureRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Structures
  // ---------------------------------------------------------------------

  virtual Result InsertStructure(Transaction&, const StructureRecord&) = 0;

  virtual std::optional<StructureRecord> GetStructure(Transaction&, const std::string& uuid) = 0;

  // Insertion order.
  virtual std::vector<StructureRecord> QueryStructures(Transaction&, const StructureFilter&) = 0;

  // `json` is a compact JSON value.
  virtual Result SetExtra(Transaction&, const std::string& uuid, const std::string& key, const std::string& json) = 0;

  // ---------------------------------------------------------------------
  // Groups
  // ---------------------------------------------------------------------

  virtual Result CreateGroup(Transaction&, const std::string& label) = 0;

  virtual bool GroupExists(Transaction&, const std::string& label) = 0;

  // Members already in the group are left alone.
  virtual Result AddToGroup(Transaction&, const std::string& label, const std::vector<std::string>& uuids) = 0;

  // uuids in the order they were added
  virtual std::vector<std::string> GroupMembers(Transaction&, const std::string& label) = 0;
};

} // namespace mc3d::db
