#include "internal/selection/family_resolver.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mc3d::selection {

using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

int64_t AsInt(size_t n) {
  return static_cast<int64_t>(n);
}

} // namespace

ResolutionReport FamilyResolver::Resolve(const model::Partition& families, const ledger::DeprecationLedger& ledger,
                                         const model::GoldenRecordMap& previous, const std::set<std::string>& excludable) {
  ResolutionReport report;

  std::map<std::string, size_t> source_to_family;
  for (size_t i = 0; i < families.size(); ++i) {
    for (const auto& source : families[i]) {
      source_to_family[source] = i;
    }
  }

  // ------------------------------------------------------------
  // 0. ledger vs partition
  // ------------------------------------------------------------

  std::vector<std::string> deprecated_in_partition;
  for (const auto& [source, _] : ledger.Entries()) {
    if (source_to_family.contains(source)) deprecated_in_partition.push_back(source);
  }
  if (!deprecated_in_partition.empty()) {
    MC3D_LOG_CRITICAL("Deprecated sources found in the new families",
                      {IntField("sources", AsInt(deprecated_in_partition.size())),
                       StringField("first", deprecated_in_partition.front())});
    throw util::ConsistencyFailure(std::to_string(deprecated_in_partition.size()) +
                                   " deprecated sources appear in the new families, e.g. " +
                                   deprecated_in_partition.front());
  }

  // ------------------------------------------------------------
  // 1. previous ids
  // ------------------------------------------------------------

  std::set<std::string> golden_sources;
  for (const auto& [_, record] : previous) {
    golden_sources.insert(model::Format(record.golden_structure.source));
  }

  for (const auto& [stable_id, record] : previous) {
    std::set<size_t> indices;
    for (const auto& source : record.duplicate_family) {
      auto it = source_to_family.find(source);
      if (it != source_to_family.end()) indices.insert(it->second);
    }

    if (indices.size() == 1) {
      report.associated[stable_id] = *indices.begin();
      continue;
    }
    if (indices.size() > 1) {
      report.split[stable_id] = {indices.begin(), indices.end()};
      continue;
    }

    const bool all_deprecated = std::all_of(record.duplicate_family.begin(), record.duplicate_family.end(),
                                            [&](const std::string& source) { return ledger.Contains(source); });
    if (all_deprecated) {
      report.deprecated.push_back(stable_id);
    } else {
      report.orphaned[stable_id] = model::Format(record.golden_structure.source);
    }
  }

  // ------------------------------------------------------------
  // 2. claims
  // ------------------------------------------------------------

  std::map<size_t, std::vector<std::string>> claims;
  for (const auto& [stable_id, index] : report.associated) {
    claims[index].push_back(stable_id);
  }
  for (const auto& [stable_id, indices] : report.split) {
    for (size_t index : indices) {
      const auto& family        = families[index];
      const bool  holds_golden  = std::any_of(family.begin(), family.end(),
                                              [&](const std::string& source) { return golden_sources.contains(source); });
      // parts holding a golden source are left for the new families
      if (!holds_golden) claims[index].push_back(stable_id);
    }
  }

  for (const auto& [index, stable_ids] : claims) {
    if (stable_ids.size() > 1) {
      report.conflicts.push_back({index, stable_ids});
      MC3D_LOG_WARN("Family claimed by several ids", {IntField("family", AsInt(index)),
                                                      StringField("first", stable_ids[0]),
                                                      StringField("second", stable_ids[1]),
                                                      IntField("claims", AsInt(stable_ids.size()))});
    }
  }

  // ------------------------------------------------------------
  // 3. new families
  // ------------------------------------------------------------

  for (size_t i = 0; i < families.size(); ++i) {
    if (claims.contains(i)) continue;

    const auto& family = families[i];
    const bool  only_excludable =
        !family.empty() && std::all_of(family.begin(), family.end(),
                                       [&](const std::string& source) { return excludable.contains(source); });
    if (only_excludable) {
      report.excluded.push_back(i);
      continue;
    }

    report.new_family_indices.push_back(i);
    report.new_families.push_back(family);
  }

  MC3D_LOG_INFO("Resolved families", {IntField("families", AsInt(families.size())),
                                      IntField("associated", AsInt(report.associated.size())),
                                      IntField("split", AsInt(report.split.size())),
                                      IntField("deprecated", AsInt(report.deprecated.size())),
                                      IntField("orphaned", AsInt(report.orphaned.size())),
                                      IntField("conflicts", AsInt(report.conflicts.size())),
                                      IntField("excluded", AsInt(report.excluded.size())),
                                      IntField("new", AsInt(report.new_families.size()))});

  for (const auto& [stable_id, golden] : report.orphaned) {
    MC3D_LOG_WARN("Id lost its family", {StringField("id", stable_id), StringField("golden_source", golden)});
  }

  return report;
}

} // namespace mc3d::selection
