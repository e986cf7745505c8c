#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace mc3d::model {

/*
  Identity of one record in an external crystallography database.

  The canonical string "database|version|id" is the join key used by every
  stage (checkpoint, ledger, families, golden records). Identity is never
  re-derived except through Format() or its exact inverse Parse().
*/
struct SourceIdentity {
  std::string database;
  std::string version;
  std::string id;

  bool operator==(const SourceIdentity& other) const = default;
};

// Raw "source" dictionary as found on imported records.
using SourceFields = std::map<std::string, std::string>;

// Throws util::FormatError unless the string has exactly three '|' separated fields.
SourceIdentity Parse(const std::string& source_string);

std::string Format(const SourceIdentity& identity);

/*
  Resolves identity from a raw source dictionary.

  Prefers "database"; falls back to the legacy "db_name" which is translated
  through a fixed table. Throws util::UnknownDatabaseError if neither yields a
  database and util::FormatError if version or id are missing.
*/
SourceIdentity FromFields(const SourceFields& fields);

// "Crystallography Open Database" -> "cod", ...; nullopt if unknown.
std::optional<std::string> DatabaseFromLegacyName(const std::string& db_name);

// Inverse of DatabaseFromLegacyName.
std::optional<std::string> LegacyDatabaseName(const std::string& database);

} // namespace mc3d::model

template <>
struct std::hash<mc3d::model::SourceIdentity> {
  std::size_t operator()(const mc3d::model::SourceIdentity& identity) const noexcept {
    return std::hash<std::string>{}(mc3d::model::Format(identity));
  }
};
