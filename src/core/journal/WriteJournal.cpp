#include "WriteJournal.hpp"
#include "InitDb.hpp"
#include <stdexcept>
#include <sqlite3.h>

namespace bw {

namespace {

std::string column_text(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : std::string();
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db));
  }
  return st;
}

}  // namespace

WriteJournal::WriteJournal(const std::string& dbPath) : db_(openJournalDb(dbPath)) {}

WriteJournal::~WriteJournal() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void WriteJournal::record(const WriteRecord& r) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO write_history
      (id, destination, bytes, strategy, outcome, error_kind, details, started_at, finished_at)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  int i=1;
  sqlite3_bind_text(st, i++, r.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.destination.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, i++, r.bytes);
  sqlite3_bind_text(st, i++, r.strategy.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.outcome.c_str(), -1, SQLITE_TRANSIENT);
  if (r.error_kind.empty()) sqlite3_bind_null(st, i++);
  else sqlite3_bind_text(st, i++, r.error_kind.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st, i++, r.details_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st, i++, r.started_at);
  sqlite3_bind_int64(st, i++, r.finished_at);

  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("record failed: " + err);
  }
  sqlite3_finalize(st);
}

std::vector<WriteRecord> WriteJournal::recent(int limit) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    SELECT id, destination, bytes, strategy, outcome, error_kind, details, started_at, finished_at
    FROM write_history
    ORDER BY finished_at DESC, rowid DESC
    LIMIT ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql);
  sqlite3_bind_int(st, 1, limit);

  std::vector<WriteRecord> out;
  int rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    WriteRecord r;
    r.id           = column_text(st, 0);
    r.destination  = column_text(st, 1);
    r.bytes        = sqlite3_column_int64(st, 2);
    r.strategy     = column_text(st, 3);
    r.outcome      = column_text(st, 4);
    r.error_kind   = column_text(st, 5);
    r.details_json = column_text(st, 6);
    r.started_at   = sqlite3_column_int64(st, 7);
    r.finished_at  = sqlite3_column_int64(st, 8);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("recent failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

}  // namespace bw
