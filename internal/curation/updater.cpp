#include "internal/curation/updater.hpp"

#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::curation {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

std::string DatabaseId(const model::SourceIdentity& source) {
  return source.database + "|" + source.id;
}

std::vector<db::StructureRecord> Members(db::StructureRepository& repository, db::Transaction& tx, const std::string& group) {
  db::StructureFilter filter;
  filter.groups = {group};
  return repository.QueryStructures(tx, filter);
}

} // namespace

UpdateOutcome Update(db::StructureRepository& repository, const matching::StructureMatcher& matcher,
                     const std::string& old_group, const std::string& new_group, const std::string& target_group) {
  auto tx = repository.Begin();
  for (const auto& group : {old_group, new_group}) {
    if (!repository.GroupExists(*tx, group)) {
      throw util::NotFound("group '" + group + "' does not exist");
    }
  }
  if (!repository.GroupExists(*tx, target_group)) {
    db::ThrowIfError(repository.CreateGroup(*tx, target_group), "create group " + target_group);
    MC3D_LOG_INFO("Created group", {StringField("group", target_group)});
  }

  std::set<std::string> target_ids;
  for (const auto& record : Members(repository, *tx, target_group)) {
    target_ids.insert(DatabaseId(record.source));
  }
  if (!target_ids.empty()) {
    MC3D_LOG_INFO("Target group not empty, its ids are skipped", {StringField("group", target_group),
                                                                 IntField("structures", static_cast<int64_t>(target_ids.size()))});
  }

  std::map<std::string, db::StructureRecord> old_by_id;
  for (auto& record : Members(repository, *tx, old_group)) {
    old_by_id.emplace(DatabaseId(record.source), std::move(record));
  }

  UpdateOutcome            outcome;
  std::vector<std::string> selected;

  for (const auto& record : Members(repository, *tx, new_group)) {
    const auto id = DatabaseId(record.source);
    if (target_ids.contains(id)) {
      ++outcome.skipped;
      continue;
    }
    target_ids.insert(id);

    auto old = old_by_id.find(id);
    if (old == old_by_id.end()) {
      selected.push_back(record.uuid);
      ++outcome.added;
    } else if (matcher.Fit(old->second.geometry, record.geometry)) {
      selected.push_back(old->second.uuid);
      ++outcome.kept_old;
    } else {
      selected.push_back(record.uuid);
      ++outcome.updated;
    }
  }

  db::ThrowIfError(repository.AddToGroup(*tx, target_group, selected), "add to group " + target_group);
  tx->Commit();

  MC3D_LOG_INFO("Update finished", {StringField("target_group", target_group),
                                    IntField("kept_old", static_cast<int64_t>(outcome.kept_old)),
                                    IntField("updated", static_cast<int64_t>(outcome.updated)),
                                    IntField("added", static_cast<int64_t>(outcome.added)),
                                    IntField("skipped", static_cast<int64_t>(outcome.skipped))});
  return outcome;
}

} // namespace mc3d::curation
