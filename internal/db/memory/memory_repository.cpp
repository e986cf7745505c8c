#include "internal/db/memory/memory_repository.hpp"

#include <algorithm>

#include "internal/db/memory/memory_tx.hpp"

namespace mc3d::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Structures
// ------------------------------------------------------------------

Result MemoryRepository::InsertStructure(Transaction& t, const StructureRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.uuid.empty()) return Result::Err(ErrorCode::ConstraintViolation, "structure uuid is empty");
  if (s.structures.contains(r.uuid)) return Result::Err(ErrorCode::AlreadyExists, r.uuid);
  s.structures[r.uuid] = r;
  s.insertion_order.push_back(r.uuid);
  return Result::Ok();
}

std::optional<StructureRecord> MemoryRepository::GetStructure(Transaction& t, const std::string& uuid) {
  const auto& s  = TX(t).View();
  auto        it = s.structures.find(uuid);
  if (it == s.structures.end()) return std::nullopt;
  return it->second;
}

std::vector<StructureRecord> MemoryRepository::QueryStructures(Transaction& t, const StructureFilter& filter) {
  const auto& s = TX(t).View();

  std::vector<StructureRecord> out;
  for (const auto& uuid : s.insertion_order) {
    if (!filter.groups.empty()) {
      bool member = false;
      for (const auto& label : filter.groups) {
        auto it = s.groups.find(label);
        if (it != s.groups.end() && std::find(it->second.begin(), it->second.end(), uuid) != it->second.end()) {
          member = true;
          break;
        }
      }
      if (!member) continue;
    }

    const auto& record = s.structures.at(uuid);
    if (MatchesAttributes(record, filter)) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::SetExtra(Transaction& t, const std::string& uuid, const std::string& key, const std::string& json) {
  auto& s  = TX(t).Mutable();
  auto  it = s.structures.find(uuid);
  if (it == s.structures.end()) return Result::Err(ErrorCode::NotFound, uuid);
  it->second.extras[key] = json;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result MemoryRepository::CreateGroup(Transaction& t, const std::string& label) {
  auto& s = TX(t).Mutable();
  if (s.groups.contains(label)) return Result::Err(ErrorCode::AlreadyExists, label);
  s.groups[label];
  return Result::Ok();
}

bool MemoryRepository::GroupExists(Transaction& t, const std::string& label) {
  return TX(t).View().groups.contains(label);
}

Result MemoryRepository::AddToGroup(Transaction& t, const std::string& label, const std::vector<std::string>& uuids) {
  auto& s  = TX(t).Mutable();
  auto  it = s.groups.find(label);
  if (it == s.groups.end()) return Result::Err(ErrorCode::NotFound, label);

  auto& members = it->second;
  for (const auto& uuid : uuids) {
    if (!s.structures.contains(uuid)) return Result::Err(ErrorCode::NotFound, uuid);
    if (std::find(members.begin(), members.end(), uuid) == members.end()) {
      members.push_back(uuid);
    }
  }
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::GroupMembers(Transaction& t, const std::string& label) {
  const auto& s  = TX(t).View();
  auto        it = s.groups.find(label);
  if (it == s.groups.end()) return {};
  return it->second;
}

} // namespace mc3d::db::memory
