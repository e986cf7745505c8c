#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/deprecation.hpp"

namespace mc3d::ledger {

/*
  Source string -> deprecation reason.

  On disk: JSON object, keys sorted, indent 2. Keys are validated as source
  identity strings on load.
*/
class DeprecationLedger {
 public:
  using Map = std::map<std::string, model::DeprecationReason>;

  DeprecationLedger() = default;
  explicit DeprecationLedger(Map entries) : entries_(std::move(entries)) {
  }

  // Throws util::NotFound / util::FormatError.
  static DeprecationLedger Load(const std::filesystem::path& path);
  static DeprecationLedger LoadOrEmpty(const std::filesystem::path& path);

  static DeprecationLedger      FromJson(const google::protobuf::Value& value);
  google::protobuf::Value       ToJson() const;
  void                          Save(const std::filesystem::path& path) const;

  void Put(const std::string& source, model::DeprecationReason reason);

  bool Contains(const std::string& source) const {
    return entries_.contains(source);
  }

  size_t Size() const {
    return entries_.size();
  }

  const Map& Entries() const {
    return entries_;
  }

  // Keys present in both, sorted.
  std::vector<std::string> Overlap(const DeprecationLedger& other) const;

 private:
  Map entries_;
};

// Disjoint union. Throws util::LedgerConflictError listing the shared keys.
DeprecationLedger Merge(const DeprecationLedger& a, const DeprecationLedger& b);

enum class MergePolicy {
  // new entries win; overlap is logged
  kOverwrite,
  // overlap aborts, file untouched
  kRejectOnConflict,
  // overlap asks `confirm`; declined aborts, file untouched
  kConfirmOverwrite,
};

// Called with the overlapping keys; true allows the overwrite.
using ConfirmFn = std::function<bool(const std::vector<std::string>& overlapping)>;

struct MergeOutcome {
  size_t added       = 0;
  size_t overwritten = 0;
  size_t total       = 0;
};

/*
  Merges `entries` into the ledger file at `path` (created when missing).

  Aborts with util::LedgerConflictError before writing when the policy
  rejects the overlap.
*/
MergeOutcome MergeInto(const std::filesystem::path& path, const DeprecationLedger& entries, MergePolicy policy,
                       const ConfirmFn& confirm = {});

} // namespace mc3d::ledger
