// src/core/journal/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace bw {

namespace {

struct Migration {
  int version;
  const char* sql;
};

// Applied in order; each step moves user_version to its own version.
const Migration kMigrations[] = {
  {1, R"sql(
    CREATE TABLE IF NOT EXISTS write_history (
      id           TEXT PRIMARY KEY,
      destination  TEXT NOT NULL,
      bytes        INTEGER NOT NULL,
      strategy     TEXT NOT NULL CHECK (strategy IN ('stream', 'fallback', 'none')),
      outcome      TEXT NOT NULL CHECK (outcome IN ('ok', 'failed')),
      error_kind   TEXT,
      details      TEXT NOT NULL DEFAULT '{}',
      started_at   INTEGER NOT NULL,
      finished_at  INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_write_history_finished ON write_history (finished_at);
    CREATE INDEX IF NOT EXISTS idx_write_history_destination ON write_history (destination);
  )sql"},
};

void execAll(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("SQLite exec failed: " + msg);
  }
}

int userVersion(sqlite3* db) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  int version = 0;
  if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
  sqlite3_finalize(st);
  return version;
}

void migrate(sqlite3* db, const std::string& dbPath) {
  // IMMEDIATE takes the write lock before the version is read, so two
  // processes opening a fresh journal do not both apply the same step.
  execAll(db, "BEGIN IMMEDIATE;");
  try {
    const int current = userVersion(db);
    if (current > kJournalSchemaVersion) {
      throw std::runtime_error("journal " + dbPath + " has schema version " +
                               std::to_string(current) + ", newer than supported " +
                               std::to_string(kJournalSchemaVersion));
    }
    for (const auto& m : kMigrations) {
      if (m.version <= current) continue;
      execAll(db, m.sql);
      execAll(db, "PRAGMA user_version=" + std::to_string(m.version) + ";");
      spdlog::info("journal {} migrated to schema version {}", dbPath, m.version);
    }
    execAll(db, "COMMIT;");
  } catch (const std::exception&) {
    sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

}  // namespace

sqlite3* openJournalDb(const std::string& dbPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("cannot create journal directory " + parent.string() + ": " +
                               ec.message());
    }
  }

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(
      dbPath.c_str(),
      &db,
      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
      nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open journal " + dbPath + ": " + msg);
  }

  try {
    sqlite3_busy_timeout(db, 5000);
    // Writers from several threads append concurrently.
    execAll(db, "PRAGMA journal_mode=WAL;");
    execAll(db, "PRAGMA synchronous=NORMAL;");
    migrate(db, dbPath);
    return db;
  } catch (const std::exception&) {
    sqlite3_close(db);
    throw;
  }
}

int initJournal(const std::string& dbPath) {
  sqlite3* db = openJournalDb(dbPath);
  int version = 0;
  try {
    version = userVersion(db);
  } catch (const std::exception&) {
    sqlite3_close(db);
    throw;
  }
  sqlite3_close(db);
  return version;
}

}  // namespace bw
