#include "internal/ledger/deprecation_ledger.hpp"


#include "internal/model/source_identity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::ledger {

using google::protobuf::Value;
using mc3d::observability::IntField;
using mc3d::observability::StringField;

namespace {

std::string JoinKeys(const std::vector<std::string>& keys, size_t limit = 5) {
  std::string out;
  for (size_t i = 0; i < keys.size() && i < limit; ++i) {
    if (i) out += ", ";
    out += keys[i];
  }
  if (keys.size() > limit) out += ", ...";
  return out;
}

} // namespace

DeprecationLedger DeprecationLedger::FromJson(const Value& value) {
  if (value.kind_case() != Value::kStructValue) {
    throw util::FormatError("deprecation ledger: expected a JSON object");
  }

  Map entries;
  for (const auto& [source, reason] : value.struct_value().fields()) {
    model::Parse(source);

    if (reason.kind_case() != Value::kStringValue) {
      throw util::FormatError("deprecation ledger: reason for '" + source + "' must be a string");
    }
    auto parsed = model::ParseDeprecationReason(reason.string_value());
    if (!parsed) {
      throw util::FormatError("deprecation ledger: unknown reason '" + reason.string_value() + "' for '" + source + "'");
    }
    entries.emplace(source, *parsed);
  }
  return DeprecationLedger(std::move(entries));
}

DeprecationLedger DeprecationLedger::Load(const std::filesystem::path& path) {
  return FromJson(util::ReadJsonFile(path));
}

DeprecationLedger DeprecationLedger::LoadOrEmpty(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) return {};
  return Load(path);
}

Value DeprecationLedger::ToJson() const {
  Value value;
  auto* fields = value.mutable_struct_value()->mutable_fields();
  for (const auto& [source, reason] : entries_) {
    (*fields)[source] = util::StringValue(std::string(model::ToString(reason)));
  }
  return value;
}

void DeprecationLedger::Save(const std::filesystem::path& path) const {
  util::WriteJsonFileAtomic(path, ToJson(), 2);
}

void DeprecationLedger::Put(const std::string& source, model::DeprecationReason reason) {
  entries_[source] = reason;
}

std::vector<std::string> DeprecationLedger::Overlap(const DeprecationLedger& other) const {
  std::vector<std::string> keys;
  for (const auto& [source, _] : entries_) {
    if (other.Contains(source)) keys.push_back(source);
  }
  return keys;
}

DeprecationLedger Merge(const DeprecationLedger& a, const DeprecationLedger& b) {
  auto overlap = a.Overlap(b);
  if (!overlap.empty()) {
    throw util::LedgerConflictError(
        std::to_string(overlap.size()) + " overlapping ledger keys: " + JoinKeys(overlap), std::move(overlap));
  }

  auto merged = a.Entries();
  merged.insert(b.Entries().begin(), b.Entries().end());
  return DeprecationLedger(std::move(merged));
}

MergeOutcome MergeInto(const std::filesystem::path& path, const DeprecationLedger& entries, MergePolicy policy,
                       const ConfirmFn& confirm) {
  const bool exists   = std::filesystem::exists(path);
  auto       existing = DeprecationLedger::LoadOrEmpty(path);
  auto       overlap  = existing.Overlap(entries);

  if (exists) {
    MC3D_LOG_INFO("Ledger exists, updating", {StringField("path", path.string())});
  }

  if (!overlap.empty()) {
    const auto count = static_cast<int64_t>(overlap.size());

    switch (policy) {
      case MergePolicy::kOverwrite:
        MC3D_LOG_WARN("Overwriting existing ledger entries", {StringField("path", path.string()), IntField("overlapping", count)});
        break;

      case MergePolicy::kRejectOnConflict:
        MC3D_LOG_CRITICAL("New entries overlap the ledger, nothing written",
                          {StringField("path", path.string()), IntField("overlapping", count),
                           StringField("keys", JoinKeys(overlap))});
        throw util::LedgerConflictError(path.string() + ": " + std::to_string(overlap.size()) + " overlapping keys",
                                        std::move(overlap));

      case MergePolicy::kConfirmOverwrite:
        MC3D_LOG_WARN("New entries overlap the ledger", {StringField("path", path.string()), IntField("overlapping", count)});
        if (!confirm || !confirm(overlap)) {
          MC3D_LOG_ERROR("Ledger update aborted", {StringField("path", path.string())});
          throw util::LedgerConflictError(path.string() + ": overwrite of " + std::to_string(overlap.size()) +
                                              " keys not confirmed",
                                          std::move(overlap));
        }
        break;
    }
  }

  MergeOutcome outcome;
  outcome.overwritten = overlap.size();
  outcome.added       = entries.Size() - overlap.size();

  auto merged = existing.Entries();
  for (const auto& [source, reason] : entries.Entries()) {
    merged[source] = reason;
  }

  DeprecationLedger result(std::move(merged));
  result.Save(path);
  outcome.total = result.Size();

  MC3D_LOG_INFO("Ledger written", {StringField("path", path.string()), IntField("added", static_cast<int64_t>(outcome.added)),
                                   IntField("overwritten", static_cast<int64_t>(outcome.overwritten)),
                                   IntField("total", static_cast<int64_t>(outcome.total))});
  return outcome;
}

} // namespace mc3d::ledger
