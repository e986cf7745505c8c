#include "internal/model/source_identity.hpp"

#include <array>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace mc3d::model {

namespace {

constexpr char kSeparator = '|';

const std::array<std::pair<const char*, const char*>, 3> kLegacyDatabaseNames = {{
    {"Crystallography Open Database", "cod"},
    {"Icsd", "icsd"},
    {"Materials Platform for Data Science", "mpds"},
}};

std::optional<std::string> Lookup(const SourceFields& fields, const std::string& key) {
  auto it = fields.find(key);
  if (it == fields.end()) return std::nullopt;
  return it->second;
}

} // namespace

SourceIdentity Parse(const std::string& source_string) {
  std::vector<std::string> parts;
  std::string              current;
  for (char c : source_string) {
    if (c == kSeparator) {
      parts.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  parts.push_back(std::move(current));

  if (parts.size() != 3) {
    throw util::FormatError("malformed source identity '" + source_string + "': expected 3 fields, got " + std::to_string(parts.size()));
  }

  return SourceIdentity{std::move(parts[0]), std::move(parts[1]), std::move(parts[2])};
}

std::string Format(const SourceIdentity& identity) {
  std::string out;
  out.reserve(identity.database.size() + identity.version.size() + identity.id.size() + 2);
  out += identity.database;
  out += kSeparator;
  out += identity.version;
  out += kSeparator;
  out += identity.id;
  return out;
}

std::optional<std::string> DatabaseFromLegacyName(const std::string& db_name) {
  for (const auto& [legacy, database] : kLegacyDatabaseNames) {
    if (db_name == legacy) return std::string(database);
  }
  return std::nullopt;
}

std::optional<std::string> LegacyDatabaseName(const std::string& database) {
  for (const auto& [legacy, name] : kLegacyDatabaseNames) {
    if (database == name) return std::string(legacy);
  }
  return std::nullopt;
}

SourceIdentity FromFields(const SourceFields& fields) {
  SourceIdentity identity;

  if (auto database = Lookup(fields, "database")) {
    identity.database = *database;
  } else if (auto db_name = Lookup(fields, "db_name")) {
    auto mapped = DatabaseFromLegacyName(*db_name);
    if (!mapped) {
      throw util::UnknownDatabaseError("unknown legacy database name '" + *db_name + "'");
    }
    identity.database = *mapped;
  } else {
    throw util::UnknownDatabaseError("source has neither 'database' nor 'db_name'");
  }

  auto version = Lookup(fields, "version");
  auto id      = Lookup(fields, "id");
  if (!version || !id) {
    throw util::FormatError("source for database '" + identity.database + "' is missing 'version' or 'id'");
  }

  identity.version = *version;
  identity.id      = *id;
  return identity;
}

} // namespace mc3d::model
