#include "WriteOrchestrator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <stdexcept>

#include "core/config/Config.hpp"
#include "core/journal/WriteJournal.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/api/StreamingWriteClient.hpp"
#include "services/fallback/ChunkedFallbackWriter.hpp"

using nlohmann::json;

namespace bw {

struct WriteOrchestrator::Attempt {
  WriteRecord rec;
  json details = json::object();
};

namespace {

void notify_fallback(const WriteOptions& options, const BlobWriteError& e, json& details) {
  spdlog::warn("streaming write to {} failed ({}), falling back: {}", options.path, e.kind(), e.what());
  details["stream_error"] = {{"kind", e.kind()}, {"message", e.what()}};
  if (!options.onFallback) return;
  try {
    options.onFallback(e);
  } catch (const std::exception& cbErr) {
    spdlog::warn("fallback callback threw: {}", cbErr.what());
  }
}

}  // namespace

SessionProvider default_session_provider() {
  return [] { return ServerSession::instance().acquire(); };
}

WriteOrchestrator::WriteOrchestrator(PathResolver resolver,
                                     FilesystemBridge& bridge,
                                     SessionProvider sessions,
                                     WriteJournal* journal,
                                     std::optional<std::chrono::seconds> streamTimeout)
  : resolver_(std::move(resolver)),
    bridge_(bridge),
    sessions_(std::move(sessions)),
    journal_(journal),
    streamTimeout_(streamTimeout) {}

void WriteOrchestrator::journal(const Attempt& a) const {
  if (!journal_) return;
  WriteRecord rec = a.rec;
  rec.details_json = a.details.dump();
  rec.finished_at = static_cast<int64_t>(std::time(nullptr));
  try {
    journal_->record(rec);
  } catch (const std::exception& e) {
    spdlog::error("journal record failed: {}", e.what());
  }
}

std::string WriteOrchestrator::write(const WriteOptions& options) const {
  if (!options.blob) throw std::invalid_argument("write requires a blob");
  const BlobSource& blob = *options.blob;

  Attempt a;
  a.rec.id = uuid4();
  a.rec.destination = options.path;
  a.rec.bytes = static_cast<int64_t>(blob.size());
  a.rec.started_at = static_cast<int64_t>(std::time(nullptr));
  a.details["recursive"] = options.recursive;
  if (options.directory) a.details["directory"] = to_string(*options.directory);

  ResolvedPath target;
  try {
    target = resolver_.resolve(options.directory, options.path);
  } catch (const InvalidPathError& e) {
    a.rec.strategy = "none";
    a.rec.outcome = "failed";
    a.rec.error_kind = e.kind();
    a.details["error"] = e.what();
    journal(a);
    throw;
  }
  a.rec.destination = target.absolute.string();

  // Streaming, exactly once.
  try {
    StreamingWriteClient client(sessions_(), streamTimeout_);
    std::string out = client.put(target.absolute, blob, options.recursive);
    a.rec.strategy = "stream";
    a.rec.outcome = "ok";
    journal(a);
    return out;
  } catch (const BlobWriteError& e) {
    notify_fallback(options, e, a.details);
  } catch (const std::exception& e) {
    notify_fallback(options, IoError(e.what()), a.details);
  }

  a.rec.strategy = "fallback";
  try {
    ChunkedFallbackWriter writer(bridge_);
    std::string out = writer.write(target.absolute, blob, options.recursive);
    a.rec.outcome = "ok";
    journal(a);
    return out;
  } catch (const BlobWriteError& e) {
    spdlog::error("fallback write to {} failed: {}", a.rec.destination, e.what());
    a.rec.outcome = "failed";
    a.rec.error_kind = e.kind();
    a.details["error"] = e.what();
    journal(a);
    throw;
  } catch (const std::exception& e) {
    spdlog::error("fallback write to {} failed: {}", a.rec.destination, e.what());
    IoError wrapped(e.what());
    a.rec.outcome = "failed";
    a.rec.error_kind = wrapped.kind();
    a.details["error"] = e.what();
    journal(a);
    throw wrapped;
  }
}

std::future<std::string> WriteOrchestrator::submit(WriteOptions options) const {
  return std::async(std::launch::async,
                    [self = *this, opts = std::move(options)] { return self.write(opts); });
}

std::unique_ptr<WriteJournal> open_journal_or_null(const std::string& dbPath) {
  if (dbPath.empty()) return nullptr;
  try {
    return std::make_unique<WriteJournal>(dbPath);
  } catch (const std::exception& e) {
    spdlog::error("journal disabled, cannot open {}: {}", dbPath, e.what());
    return nullptr;
  }
}

std::future<std::string> write_blob(WriteOptions options) {
  static const Config config = [] {
    Config c = Config::fromEnvironment();
    configure_logging(c.logLevel);
    return c;
  }();
  static LocalFSBackend backend;
  static const std::unique_ptr<WriteJournal> journal = open_journal_or_null(config.journalPath);
  static const WriteOrchestrator orchestrator(PathResolver(config.roots), backend,
                                              default_session_provider(), journal.get(),
                                              config.streamTimeout);
  return orchestrator.submit(std::move(options));
}

}  // namespace bw
