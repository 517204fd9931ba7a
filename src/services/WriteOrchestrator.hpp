#pragma once
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "core/Errors.hpp"
#include "core/blob/BlobSource.hpp"
#include "core/paths/PathResolver.hpp"
#include "core/storage/FilesystemBridge.hpp"
#include "services/api/ServerSession.hpp"

namespace bw {

class WriteJournal;

struct WriteOptions {
  std::string path;
  std::optional<Directory> directory;
  std::shared_ptr<const BlobSource> blob;
  bool recursive = false;
  // Called once, synchronously, with the streaming failure before the
  // fallback starts. Exceptions it throws are logged and dropped.
  std::function<void(const BlobWriteError&)> onFallback;
};

using SessionProvider = std::function<SessionInfo()>;

// Acquires the process-wide ServerSession.
SessionProvider default_session_provider();

// Tries the streaming path once, then falls back to chunked append on any
// streaming failure. Path errors are fatal and skip both.
class WriteOrchestrator {
public:
  WriteOrchestrator(PathResolver resolver,
                    FilesystemBridge& bridge,
                    SessionProvider sessions = default_session_provider(),
                    WriteJournal* journal = nullptr,
                    std::optional<std::chrono::seconds> streamTimeout = std::nullopt);

  // Blocks until the write is done. Returns the absolute path or throws the
  // terminal error.
  std::string write(const WriteOptions& options) const;

  // Runs write() on its own thread. The future resolves exactly once.
  // The task holds a copy of this orchestrator, so it may be destroyed while
  // the future is pending; the bridge and journal must outlive the future.
  std::future<std::string> submit(WriteOptions options) const;

private:
  struct Attempt;
  void journal(const Attempt& a) const;

  PathResolver resolver_;
  FilesystemBridge& bridge_;
  SessionProvider sessions_;
  WriteJournal* journal_;
  std::optional<std::chrono::seconds> streamTimeout_;
};

// Opens the journal at dbPath, or returns null when dbPath is empty or the
// journal cannot be opened (logged). Writes then proceed unjournaled.
std::unique_ptr<WriteJournal> open_journal_or_null(const std::string& dbPath);

// Process-default orchestrator (environment roots, local disk bridge, shared
// session, journal when BW_JOURNAL_PATH is set). The first call reads the
// environment once and applies BW_LOG_LEVEL.
std::future<std::string> write_blob(WriteOptions options);

}  // namespace bw
