#include "internal/db/source_index.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::db {

SourceIndex::SourceIndex(StructureRepository& repository, StructureFilter filter)
    : repository_(repository), filter_(std::move(filter)) {
}

void SourceIndex::Rebuild() {
  auto tx      = repository_.Begin();
  auto records = repository_.QueryStructures(*tx, filter_);
  tx->Rollback();

  std::map<std::string, std::string> index;
  for (const auto& record : records) {
    index.emplace(model::Format(record.source), record.uuid);
  }

  std::unique_lock lock(mutex_);
  index_ = std::move(index);
  built_ = true;

  MC3D_LOG_DEBUG("Source index built", {observability::IntField("sources", static_cast<int64_t>(index_.size()))});
}

void SourceIndex::Invalidate() {
  std::unique_lock lock(mutex_);
  built_ = false;
  index_.clear();
}

void SourceIndex::EnsureBuilt() {
  {
    std::shared_lock lock(mutex_);
    if (built_) return;
  }
  Rebuild();
}

std::optional<std::string> SourceIndex::Lookup(const std::string& source_string) {
  EnsureBuilt();

  std::shared_lock lock(mutex_);
  auto             it = index_.find(source_string);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> SourceIndex::Lookup(const model::SourceIdentity& identity) {
  return Lookup(model::Format(identity));
}

std::string SourceIndex::Require(const std::string& source_string) {
  auto uuid = Lookup(source_string);
  if (!uuid) {
    throw util::NotFound("no structure for source " + source_string);
  }
  return *uuid;
}

size_t SourceIndex::Size() {
  EnsureBuilt();
  std::shared_lock lock(mutex_);
  return index_.size();
}

} // namespace mc3d::db
