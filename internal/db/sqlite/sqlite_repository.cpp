#include "internal/db/sqlite/sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/model/geometry_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_file.hpp"

namespace mc3d::db::sqlite {

using google::protobuf::Value;
using mc3d::db::ErrorCode;
using mc3d::db::Result;

namespace {

// Finalizes on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;

  Statement() = default;
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::string EncodeInts(const std::vector<int>& values) {
  Value value;
  auto* list = value.mutable_list_value();
  for (int v : values) list->add_values()->set_number_value(v);
  return util::ToJson(value);
}

std::vector<int> DecodeInts(const std::string& json) {
  const auto parsed = util::ParseJson(json);
  if (parsed.kind_case() != Value::kListValue) {
    throw util::FormatError("cif_spacegroup_numbers: expected a JSON list");
  }

  std::vector<int> out;
  for (const auto& v : parsed.list_value().values()) {
    if (v.kind_case() != Value::kNumberValue) {
      throw util::FormatError("cif_spacegroup_numbers: expected numbers");
    }
    out.push_back(static_cast<int>(v.number_value()));
  }
  return out;
}

StructureRecord ReadRecord(sqlite3_stmt* st) {
  StructureRecord r;
  r.uuid            = ColText(st, 0);
  r.source.database = ColText(st, 1);
  r.source.version  = ColText(st, 2);
  r.source.id       = ColText(st, 3);
  r.formula         = ColText(st, 4);
  r.chemical_system = ColText(st, 5);
  r.geometry        = model::GeometryFromJson(util::ParseJson(ColText(st, 6)), "structure " + r.uuid);
  r.cif_spacegroup_numbers = DecodeInts(ColText(st, 7));
  if (sqlite3_column_type(st, 8) != SQLITE_NULL) {
    r.exit_status = sqlite3_column_int(st, 8);
  }
  return r;
}

constexpr const char* kSelectColumns =
    "SELECT s.uuid,s.database,s.version,s.source_id,s.formula,s.chemical_system,s.geometry,"
    "s.cif_spacegroup_numbers,s.exit_status FROM structures s";

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Structures
// ------------------------------------------------------------------

Result SqliteRepository::InsertStructure(Transaction& t, const StructureRecord& r) {
  auto* db = TX(t).Handle();

  if (r.uuid.empty()) return Result::Err(ErrorCode::ConstraintViolation, "structure uuid is empty");
  if (GetStructure(t, r.uuid)) return Result::Err(ErrorCode::AlreadyExists, r.uuid);

  const char* sql =
      "INSERT INTO structures(uuid,database,version,source_id,formula,chemical_system,geometry,"
      "cif_spacegroup_numbers,exit_status) VALUES(?,?,?,?,?,?,?,?,?);";

  Statement s;
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }

  BindText(s.st, 1, r.uuid);
  BindText(s.st, 2, r.source.database);
  BindText(s.st, 3, r.source.version);
  BindText(s.st, 4, r.source.id);
  BindText(s.st, 5, r.formula);
  BindText(s.st, 6, r.chemical_system);
  BindText(s.st, 7, util::ToJson(model::GeometryToJson(r.geometry)));
  BindText(s.st, 8, EncodeInts(r.cif_spacegroup_numbers));
  if (r.exit_status) {
    sqlite3_bind_int(s.st, 9, *r.exit_status);
  } else {
    sqlite3_bind_null(s.st, 9);
  }

  auto result = Translate(db, sqlite3_step(s.st));
  if (!result) return result;

  for (const auto& [key, json] : r.extras) {
    result = SetExtra(t, r.uuid, key, json);
    if (!result) return result;
  }
  return Result::Ok();
}

std::optional<StructureRecord> SqliteRepository::GetStructure(Transaction& t, const std::string& uuid) {
  auto*           db  = TX(t).Handle();
  const auto      sql = std::string(kSelectColumns) + " WHERE s.uuid=?;";

  std::optional<StructureRecord> record;
  {
    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) return std::nullopt;
    BindText(s.st, 1, uuid);
    if (sqlite3_step(s.st) != SQLITE_ROW) return std::nullopt;
    record = ReadRecord(s.st);
  }

  Statement e;
  if (sqlite3_prepare_v2(db, "SELECT key,json FROM structure_extras WHERE uuid=?;", -1, &e.st, nullptr) == SQLITE_OK) {
    BindText(e.st, 1, uuid);
    while (sqlite3_step(e.st) == SQLITE_ROW) {
      record->extras[ColText(e.st, 0)] = ColText(e.st, 1);
    }
  }
  return record;
}

std::vector<StructureRecord> SqliteRepository::QueryStructures(Transaction& t, const StructureFilter& filter) {
  auto* db = TX(t).Handle();

  std::string              sql = std::string(kSelectColumns) + " WHERE 1=1";
  std::vector<std::string> params;

  if (!filter.groups.empty()) {
    sql += " AND s.uuid IN (SELECT uuid FROM group_members WHERE label IN (";
    for (size_t i = 0; i < filter.groups.size(); ++i) {
      sql += i ? ",?" : "?";
      params.push_back(filter.groups[i]);
    }
    sql += "))";
  }

  // instr() rather than LIKE: LIKE folds case
  for (const auto& element : filter.contains_elements) {
    sql += " AND instr(s.chemical_system, ?) > 0";
    params.push_back("-" + element + "-");
  }
  for (const auto& element : filter.skip_elements) {
    sql += " AND instr(s.chemical_system, ?) = 0";
    params.push_back("-" + element + "-");
  }

  if (filter.exclude_incorrect_formula) {
    sql += " AND NOT EXISTS (SELECT 1 FROM structure_extras e WHERE e.uuid=s.uuid AND e.key=?)";
    params.push_back(kExtraIncorrectFormula);
  }

  if (filter.database) {
    sql += " AND s.database=?";
    params.push_back(*filter.database);
  }

  if (filter.partial_occupancies) {
    sql += " AND EXISTS (SELECT 1 FROM structure_extras e WHERE e.uuid=s.uuid AND e.key=? AND e.json=?)";
    params.push_back(kExtraPartialOccupancies);
    params.push_back(*filter.partial_occupancies ? "true" : "false");
  }

  if (filter.contains_hydrogen) {
    sql += *filter.contains_hydrogen ? " AND instr(s.chemical_system, ?) > 0" : " AND instr(s.chemical_system, ?) = 0";
    params.push_back("-H-");
  }

  sql += " ORDER BY s.rowid;";

  std::vector<std::string> uuids;
  {
    Statement s;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) return {};
    for (size_t i = 0; i < params.size(); ++i) {
      BindText(s.st, static_cast<int>(i + 1), params[i]);
    }
    while (sqlite3_step(s.st) == SQLITE_ROW) {
      uuids.push_back(ColText(s.st, 0));
    }
  }

  std::vector<StructureRecord> out;
  out.reserve(uuids.size());
  for (const auto& uuid : uuids) {
    if (auto record = GetStructure(t, uuid)) out.push_back(std::move(*record));
  }
  return out;
}

Result SqliteRepository::SetExtra(Transaction& t, const std::string& uuid, const std::string& key, const std::string& json) {
  auto* db = TX(t).Handle();

  {
    Statement s;
    if (sqlite3_prepare_v2(db, "SELECT 1 FROM structures WHERE uuid=?;", -1, &s.st, nullptr) != SQLITE_OK) {
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    BindText(s.st, 1, uuid);
    if (sqlite3_step(s.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, uuid);
  }

  Statement s;
  const char* sql = "INSERT INTO structure_extras(uuid,key,json) VALUES(?,?,?) "
                    "ON CONFLICT(uuid,key) DO UPDATE SET json=excluded.json;";
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  BindText(s.st, 1, uuid);
  BindText(s.st, 2, key);
  BindText(s.st, 3, json);
  return Translate(db, sqlite3_step(s.st));
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result SqliteRepository::CreateGroup(Transaction& t, const std::string& label) {
  auto* db = TX(t).Handle();
  if (GroupExists(t, label)) return Result::Err(ErrorCode::AlreadyExists, label);

  Statement s;
  if (sqlite3_prepare_v2(db, "INSERT INTO groups(label) VALUES(?);", -1, &s.st, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
  BindText(s.st, 1, label);
  return Translate(db, sqlite3_step(s.st));
}

bool SqliteRepository::GroupExists(Transaction& t, const std::string& label) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, "SELECT 1 FROM groups WHERE label=?;", -1, &s.st, nullptr) != SQLITE_OK) return false;
  BindText(s.st, 1, label);
  return sqlite3_step(s.st) == SQLITE_ROW;
}

Result SqliteRepository::AddToGroup(Transaction& t, const std::string& label, const std::vector<std::string>& uuids) {
  auto* db = TX(t).Handle();
  if (!GroupExists(t, label)) return Result::Err(ErrorCode::NotFound, label);

  for (const auto& uuid : uuids) {
    {
      Statement check;
      if (sqlite3_prepare_v2(db, "SELECT 1 FROM structures WHERE uuid=?;", -1, &check.st, nullptr) != SQLITE_OK) {
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
      }
      BindText(check.st, 1, uuid);
      if (sqlite3_step(check.st) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, uuid);
    }

    Statement s;
    if (sqlite3_prepare_v2(db, "INSERT OR IGNORE INTO group_members(label,uuid) VALUES(?,?);", -1, &s.st, nullptr) != SQLITE_OK) {
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
    BindText(s.st, 1, label);
    BindText(s.st, 2, uuid);
    auto result = Translate(db, sqlite3_step(s.st));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<std::string> SqliteRepository::GroupMembers(Transaction& t, const std::string& label) {
  auto* db = TX(t).Handle();

  Statement s;
  if (sqlite3_prepare_v2(db, "SELECT uuid FROM group_members WHERE label=? ORDER BY rowid;", -1, &s.st, nullptr) != SQLITE_OK) {
    return {};
  }
  BindText(s.st, 1, label);

  std::vector<std::string> out;
  while (sqlite3_step(s.st) == SQLITE_ROW) {
    out.push_back(ColText(s.st, 0));
  }
  return out;
}

} // namespace mc3d::db::sqlite
