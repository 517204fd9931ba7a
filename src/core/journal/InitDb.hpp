#pragma once
#include <string>

struct sqlite3;

namespace bw {

// Schema revision this build reads and writes (stored in PRAGMA user_version).
constexpr int kJournalSchemaVersion = 1;

// Opens the journal at dbPath, creating the file and its parent directories
// when missing, and migrates the schema up to kJournalSchemaVersion.
// The caller owns the returned handle. Throws std::runtime_error on failure,
// including a database whose schema is newer than this build understands.
sqlite3* openJournalDb(const std::string& dbPath);

// Creates/upgrades the journal and closes it again. Idempotent.
// Returns the schema version the database is at afterwards.
int initJournal(const std::string& dbPath);

}  // namespace bw
