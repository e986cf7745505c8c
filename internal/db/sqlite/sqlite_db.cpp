#include "internal/db/sqlite/sqlite_db.hpp"

#include <stdexcept>
#include <vector>

namespace mc3d::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::BootstrapSchema() {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS structures (uuid TEXT PRIMARY KEY, database TEXT NOT NULL, version TEXT NOT NULL, source_id TEXT NOT NULL, formula TEXT NOT NULL, chemical_system TEXT NOT NULL, geometry TEXT NOT NULL, cif_spacegroup_numbers TEXT NOT NULL, exit_status INTEGER);",
      "CREATE INDEX IF NOT EXISTS structures_source ON structures(database, version, source_id);",
      "CREATE TABLE IF NOT EXISTS structure_extras (uuid TEXT NOT NULL REFERENCES structures(uuid) ON DELETE CASCADE, key TEXT NOT NULL, json TEXT NOT NULL, PRIMARY KEY (uuid, key));",
      "CREATE TABLE IF NOT EXISTS groups (label TEXT PRIMARY KEY);",
      "CREATE TABLE IF NOT EXISTS group_members (label TEXT NOT NULL REFERENCES groups(label) ON DELETE CASCADE, uuid TEXT NOT NULL REFERENCES structures(uuid) ON DELETE CASCADE, PRIMARY KEY (label, uuid));"};

  for (const auto& sql : kBootstrapSql) {
    Exec(sql);
  }
}

} // namespace mc3d::db::sqlite
