#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace bw {

struct WriteRecord {
  std::string id;
  std::string destination;
  int64_t     bytes = 0;
  std::string strategy;      // stream | fallback | none
  std::string outcome;       // ok | failed
  std::string error_kind;    // empty on success
  std::string details_json = "{}";
  int64_t     started_at = 0;
  int64_t     finished_at = 0;
};

// Append-only record of write outcomes, backed by SQLite.
class WriteJournal {
public:
  // Creates the database and applies the schema when missing (see openJournalDb).
  explicit WriteJournal(const std::string& dbPath);
  ~WriteJournal();

  WriteJournal(const WriteJournal&) = delete;
  WriteJournal& operator=(const WriteJournal&) = delete;

  void record(const WriteRecord& r);
  // Newest first.
  std::vector<WriteRecord> recent(int limit) const;

private:
  void* db_; // sqlite3*
  mutable std::mutex mu_;
};

}  // namespace bw
