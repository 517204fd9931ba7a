#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "TestUtil.hpp"
#include "core/Errors.hpp"
#include "core/journal/WriteJournal.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/WriteOrchestrator.hpp"
#include "services/fallback/ChunkedFallbackWriter.hpp"

using namespace bw;
using bw::test::files_equal;
using bw::test::make_bytes;
using bw::test::read_file;
using bw::test::write_file;
using bw::test::write_pattern_file;
namespace fs = std::filesystem;

class WriteOrchestratorTest : public bw::test::ScratchDirTest {
protected:
  void SetUp() override {
    ScratchDirTest::SetUp();
    data_ = root_ / "data";
    fs::create_directories(data_);
  }

  PathResolver resolver() const { return PathResolver({{Directory::Data, data_}}); }

  // Real loopback session.
  SessionProvider liveSession() {
    return [this] {
      ++sessionCalls_;
      return session_.acquire();
    };
  }

  // Real server, wrong token: every streaming attempt gets 401.
  SessionProvider forgedSession() {
    return [this] {
      ++sessionCalls_;
      SessionInfo s = session_.acquire();
      s.token = "forged";
      return s;
    };
  }

  WriteOptions options(const std::string& path, std::shared_ptr<const BlobSource> blob,
                       bool recursive = false) {
    WriteOptions o;
    o.path = path;
    o.directory = Directory::Data;
    o.blob = std::move(blob);
    o.recursive = recursive;
    o.onFallback = [this](const BlobWriteError& e) {
      ++fallbacks_;
      lastFallbackKind_ = e.kind();
    };
    return o;
  }

  fs::path data_;
  ServerSession session_;
  LocalFSBackend backend_;
  std::atomic<int> sessionCalls_{0};
  std::atomic<int> fallbacks_{0};
  std::string lastFallbackKind_;
};

TEST_F(WriteOrchestratorTest, StreamingRoundTripAcrossSizes) {
  // Generous timeout: publishing 100 MB includes an fsync.
  WriteOrchestrator orch(resolver(), backend_, liveSession(), nullptr, std::chrono::seconds(120));
  const std::uint64_t sizes[] = {0, 1, 1024, 1024 * 1024, 100ull * 1024 * 1024};

  for (auto size : sizes) {
    const auto src = root_ / ("src_" + std::to_string(size));
    write_pattern_file(src, size, static_cast<std::uint32_t>(size));
    const std::string rel = "stream/" + std::to_string(size) + ".bin";

    const std::string out = orch.write(options(rel, std::make_shared<FileBlob>(src), true));
    EXPECT_EQ(out, (data_ / rel).string());
    EXPECT_TRUE(files_equal(src, out)) << "size " << size;
  }
  EXPECT_EQ(fallbacks_, 0);
}

TEST_F(WriteOrchestratorTest, ForcedFallbackProducesSameContent) {
  WriteOrchestrator orch(resolver(), backend_, forgedSession());
  const std::uint64_t sizes[] = {0, 1, 1024, 1024 * 1024, 100ull * 1024 * 1024};

  int expectedFallbacks = 0;
  for (auto size : sizes) {
    const auto src = root_ / ("src_" + std::to_string(size));
    write_pattern_file(src, size, static_cast<std::uint32_t>(size) + 5);
    const std::string rel = "fallback/" + std::to_string(size) + ".bin";

    const std::string out = orch.write(options(rel, std::make_shared<FileBlob>(src), true));
    ++expectedFallbacks;
    EXPECT_EQ(fallbacks_, expectedFallbacks) << "callback must fire once per write";
    EXPECT_EQ(out, (data_ / rel).string());
    EXPECT_TRUE(files_equal(src, out)) << "size " << size;
  }
}

TEST_F(WriteOrchestratorTest, WrongTokenReportsAuthErrorToCallback) {
  WriteOrchestrator orch(resolver(), backend_, forgedSession());
  orch.write(options("a.bin", std::make_shared<MemoryBlob>("hello")));
  EXPECT_EQ(fallbacks_, 1);
  EXPECT_EQ(lastFallbackKind_, "auth");
  EXPECT_EQ(read_file(data_ / "a.bin"), "hello");
}

TEST_F(WriteOrchestratorTest, NonRecursiveMissingParentFailsOnBothPaths) {
  for (auto provider : {liveSession(), forgedSession()}) {
    WriteOrchestrator orch(resolver(), backend_, provider);
    EXPECT_THROW(orch.write(options("x/y/z.bin", std::make_shared<MemoryBlob>("abc"), false)),
                 DirectoryMissingError);
    EXPECT_FALSE(fs::exists(data_ / "x"));
  }
  // Streaming failed first each time, so the fallback was reached twice.
  EXPECT_EQ(fallbacks_, 2);
}

TEST_F(WriteOrchestratorTest, RecursiveCreatesNestedParentsOnBothPaths) {
  WriteOrchestrator streaming(resolver(), backend_, liveSession());
  streaming.write(options("s/1/2/3.bin", std::make_shared<MemoryBlob>("via stream"), true));
  EXPECT_EQ(read_file(data_ / "s/1/2/3.bin"), "via stream");
  EXPECT_EQ(fallbacks_, 0);

  WriteOrchestrator fallback(resolver(), backend_, forgedSession());
  fallback.write(options("f/1/2/3.bin", std::make_shared<MemoryBlob>("via fallback"), true));
  EXPECT_EQ(read_file(data_ / "f/1/2/3.bin"), "via fallback");
  EXPECT_EQ(fallbacks_, 1);
}

TEST_F(WriteOrchestratorTest, RepeatedWritesReplaceContent) {
  for (auto provider : {liveSession(), forgedSession()}) {
    WriteOrchestrator orch(resolver(), backend_, provider);
    orch.write(options("same.bin", std::make_shared<MemoryBlob>(make_bytes(kFallbackChunkSize * 3))));
    orch.write(options("same.bin", std::make_shared<MemoryBlob>("tail")));
    EXPECT_EQ(read_file(data_ / "same.bin"), "tail");
  }
}

TEST_F(WriteOrchestratorTest, ConcurrentWritesToDistinctPaths) {
  WriteOrchestrator orch(resolver(), backend_, liveSession());
  constexpr int kWrites = 8;

  std::vector<std::future<std::string>> futures;
  for (int i = 0; i < kWrites; ++i) {
    futures.push_back(orch.submit(options("c/" + std::to_string(i) + ".bin",
                                          std::make_shared<MemoryBlob>(make_bytes(300000, i)), true)));
  }
  for (int i = 0; i < kWrites; ++i) {
    const std::string out = futures[i].get();
    EXPECT_EQ(read_file(out), make_bytes(300000, i));
  }
  EXPECT_EQ(fallbacks_, 0);
}

TEST_F(WriteOrchestratorTest, InvalidPathIsFatalAndSkipsBothStrategies) {
  WriteOrchestrator orch(resolver(), backend_, liveSession());
  auto fut = orch.submit(options("../escape.bin", std::make_shared<MemoryBlob>("abc")));
  EXPECT_THROW(fut.get(), InvalidPathError);
  EXPECT_EQ(sessionCalls_, 0);
  EXPECT_EQ(fallbacks_, 0);
  EXPECT_FALSE(fs::exists(root_ / "escape.bin"));
}

TEST_F(WriteOrchestratorTest, SessionStartFailureFallsBack) {
  SessionProvider broken = [] () -> SessionInfo { throw NetworkError("cannot bind"); };
  WriteOrchestrator orch(resolver(), backend_, broken);
  EXPECT_EQ(orch.write(options("b.bin", std::make_shared<MemoryBlob>("abc"))), (data_ / "b.bin").string());
  EXPECT_EQ(fallbacks_, 1);
  EXPECT_EQ(lastFallbackKind_, "network");
}

TEST_F(WriteOrchestratorTest, ThrowingCallbackDoesNotAffectOutcome) {
  WriteOrchestrator orch(resolver(), backend_, forgedSession());
  auto o = options("cb.bin", std::make_shared<MemoryBlob>("abc"));
  o.onFallback = [](const BlobWriteError&) { throw std::runtime_error("observer bug"); };
  EXPECT_EQ(orch.write(o), (data_ / "cb.bin").string());
  EXPECT_EQ(read_file(data_ / "cb.bin"), "abc");
}

TEST_F(WriteOrchestratorTest, FallbackFailureRejectsWithItsError) {
  write_file(data_ / "plain", "a file");
  WriteOrchestrator orch(resolver(), backend_, liveSession());
  auto fut = orch.submit(options("plain/x.bin", std::make_shared<MemoryBlob>("abc"), true));
  EXPECT_THROW(fut.get(), IoError);
  EXPECT_EQ(fallbacks_, 1);
  EXPECT_EQ(lastFallbackKind_, "io");
}

TEST_F(WriteOrchestratorTest, JournalRecordsOneRowPerWrite) {
  WriteJournal journal((root_ / "journal.db").string());

  WriteOrchestrator live(resolver(), backend_, liveSession(), &journal);
  WriteOrchestrator forged(resolver(), backend_, forgedSession(), &journal);

  live.write(options("j1.bin", std::make_shared<MemoryBlob>("12345")));
  forged.write(options("j2.bin", std::make_shared<MemoryBlob>("abc")));
  EXPECT_THROW(live.write(options("../j3.bin", std::make_shared<MemoryBlob>("abc"))), InvalidPathError);

  auto rows = journal.recent(10);
  ASSERT_EQ(rows.size(), 3u);
  // Newest first.
  EXPECT_EQ(rows[0].strategy, "none");
  EXPECT_EQ(rows[0].outcome, "failed");
  EXPECT_EQ(rows[0].error_kind, "invalid_path");

  EXPECT_EQ(rows[1].strategy, "fallback");
  EXPECT_EQ(rows[1].outcome, "ok");
  EXPECT_EQ(rows[1].destination, (data_ / "j2.bin").string());
  EXPECT_NE(rows[1].details_json.find("\"auth\""), std::string::npos);

  EXPECT_EQ(rows[2].strategy, "stream");
  EXPECT_EQ(rows[2].outcome, "ok");
  EXPECT_EQ(rows[2].bytes, 5);
}

TEST_F(WriteOrchestratorTest, SubmittedWriteOutlivesOrchestrator) {
  std::future<std::string> fut;
  {
    WriteOrchestrator orch(resolver(), backend_, liveSession());
    fut = orch.submit(options("outlive.bin", std::make_shared<MemoryBlob>(make_bytes(500000, 3))));
  }
  const std::string out = fut.get();
  EXPECT_EQ(out, (data_ / "outlive.bin").string());
  EXPECT_EQ(read_file(out), make_bytes(500000, 3));
}

TEST_F(WriteOrchestratorTest, OpenJournalOrNullDegradesToNoJournal) {
  EXPECT_EQ(open_journal_or_null(""), nullptr);

  write_file(root_ / "plain", "a file, not a directory");
  EXPECT_EQ(open_journal_or_null((root_ / "plain" / "journal.db").string()), nullptr);

  auto journal = open_journal_or_null((root_ / "fresh" / "journal.db").string());
  ASSERT_NE(journal, nullptr);
  EXPECT_TRUE(journal->recent(1).empty());
}

// write_blob reads the environment once per process, so every setting it
// depends on is applied here, before its first call.
TEST_F(WriteOrchestratorTest, WriteBlobAppliesEnvironmentConfig) {
  const auto journalPath = root_ / "state" / "journal.db";
  ASSERT_FALSE(fs::exists(journalPath));
  ASSERT_EQ(::setenv("BW_DATA_DIR", data_.c_str(), 1), 0);
  ASSERT_EQ(::setenv("BW_JOURNAL_PATH", journalPath.c_str(), 1), 0);
  ASSERT_EQ(::setenv("BW_LOG_LEVEL", "warn", 1), 0);
  spdlog::set_level(spdlog::level::info);

  WriteOptions o;
  o.path = "env/out.bin";
  o.directory = Directory::Data;
  o.recursive = true;
  o.blob = std::make_shared<MemoryBlob>("from write_blob");

  const std::string out = write_blob(std::move(o)).get();
  EXPECT_EQ(out, (data_ / "env/out.bin").string());
  EXPECT_EQ(read_file(out), "from write_blob");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);

  // The journal was created on first use and holds this write.
  ASSERT_TRUE(fs::exists(journalPath));
  auto rows = WriteJournal(journalPath.string()).recent(5);
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].destination, out);
  EXPECT_EQ(rows[0].outcome, "ok");

  ::unsetenv("BW_DATA_DIR");
  ::unsetenv("BW_JOURNAL_PATH");
  ::unsetenv("BW_LOG_LEVEL");
}
