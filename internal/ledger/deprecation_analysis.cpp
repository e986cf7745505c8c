#include "internal/ledger/deprecation_analysis.hpp"

#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::ledger {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

std::string DatabaseId(const model::SourceIdentity& source) {
  return source.database + "|" + source.id;
}

std::vector<db::StructureRecord> GroupStructures(db::StructureRepository& repository, const std::string& group) {
  auto tx = repository.Begin();
  if (!repository.GroupExists(*tx, group)) {
    throw util::NotFound("group '" + group + "' does not exist");
  }

  db::StructureFilter filter;
  filter.groups = {group};
  auto records  = repository.QueryStructures(*tx, filter);
  tx->Rollback();
  return records;
}

int64_t AsInt(size_t n) {
  return static_cast<int64_t>(n);
}

} // namespace

DeprecationLedger DeprecationAnalysis::IdRemoved(const std::string& old_group, const std::string& new_group) {
  const auto old_records = GroupStructures(repository_, old_group);
  const auto new_records = GroupStructures(repository_, new_group);

  std::set<std::string> new_ids;
  for (const auto& record : new_records) new_ids.insert(DatabaseId(record.source));

  DeprecationLedger ledger;
  for (const auto& record : old_records) {
    if (!new_ids.contains(DatabaseId(record.source))) {
      ledger.Put(model::Format(record.source), model::DeprecationReason::kIdRemoved);
    }
  }

  MC3D_LOG_INFO("Removed ids", {StringField("old_group", old_group), IntField("old", AsInt(old_records.size())),
                                StringField("new_group", new_group), IntField("new", AsInt(new_records.size())),
                                IntField("removed", AsInt(ledger.Size()))});
  return ledger;
}

DeprecationLedger DeprecationAnalysis::StructureUpdated(const std::string& old_curated_group,
                                                        const std::string& new_final_group) {
  const auto old_records = GroupStructures(repository_, old_curated_group);
  const auto new_records = GroupStructures(repository_, new_final_group);

  std::set<std::string> new_sources;
  for (const auto& record : new_records) new_sources.insert(model::Format(record.source));

  std::map<std::string, std::string> old_by_id;
  size_t                             unchanged = 0;
  for (const auto& record : old_records) {
    const auto source = model::Format(record.source);
    old_by_id[DatabaseId(record.source)] = source;
    if (new_sources.contains(source)) ++unchanged;
  }

  std::set<std::string> versions;
  DeprecationLedger     ledger;
  for (const auto& record : new_records) {
    auto it = old_by_id.find(DatabaseId(record.source));
    if (it == old_by_id.end()) continue;
    if (it->second == model::Format(record.source)) continue;

    versions.insert(record.source.version);
    ledger.Put(it->second, model::DeprecationReason::kStructureUpdated);
  }

  std::string version_list;
  for (const auto& version : versions) {
    if (!version_list.empty()) version_list += ",";
    version_list += version;
  }

  MC3D_LOG_INFO("Updated structures", {IntField("unchanged", AsInt(unchanged)), IntField("updated", AsInt(ledger.Size())),
                                       StringField("new_versions", version_list)});
  return ledger;
}

DeprecationLedger DeprecationAnalysis::IncorrectFormula() {
  db::StructureFilter filter;

  auto tx      = repository_.Begin();
  auto records = repository_.QueryStructures(*tx, filter);
  tx->Rollback();

  DeprecationLedger ledger;
  for (const auto& record : records) {
    if (record.extras.contains(db::kExtraIncorrectFormula)) {
      ledger.Put(model::Format(record.source), model::DeprecationReason::kIncorrectFormula);
    }
  }

  MC3D_LOG_INFO("Incorrect formulas", {IntField("structures", AsInt(ledger.Size()))});
  return ledger;
}

} // namespace mc3d::ledger
