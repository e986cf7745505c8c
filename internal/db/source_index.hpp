#pragma once

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/source_identity.hpp"

namespace mc3d::db {

/*
  Memoized source string -> structure uuid lookup.

  Built once from the structures matching `filter`, on first use. Anything
  that mutates the store during the same run must call Invalidate() (or
  Rebuild()) before the next lookup. When a source string occurs on several
  structures the first inserted one wins.
*/
class SourceIndex {
 public:
  SourceIndex(StructureRepository& repository, StructureFilter filter);

  std::optional<std::string> Lookup(const std::string& source_string);
  std::optional<std::string> Lookup(const model::SourceIdentity& identity);

  // Throws util::NotFound.
  std::string Require(const std::string& source_string);

  void Rebuild();
  void Invalidate();

  size_t Size();

 private:
  void EnsureBuilt();

  StructureRepository& repository_;
  StructureFilter      filter_;

  std::shared_mutex                  mutex_;
  bool                               built_ = false;
  std::map<std::string, std::string> index_;
};

} // namespace mc3d::db
