#include <gtest/gtest.h>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <thread>

#include "TestUtil.hpp"
#include "core/paths/PathResolver.hpp"
#include "services/api/ServerSession.hpp"

using namespace bw;
using bw::test::make_bytes;
using bw::test::read_file;
using bw::test::write_file;
namespace fs = std::filesystem;

class StreamingWriteHandlerTest : public bw::test::ScratchDirTest {
protected:
  void SetUp() override {
    ScratchDirTest::SetUp();
    info_ = session_.acquire();
  }

  httplib::Client client(bool withToken = true) const {
    httplib::Client cli(info_.bindAddress, info_.port);
    if (withToken) cli.set_bearer_token_auth(info_.token);
    return cli;
  }

  std::string target(const fs::path& p, const char* recursive = "false") const {
    return percent_encode_path(p.string()) + "?recursive=" + recursive;
  }

  static std::string kind_of(const httplib::Result& res) {
    auto j = nlohmann::json::parse(res->body, nullptr, false);
    return j.is_object() ? j.value("kind", "") : "";
  }

  ServerSession session_;
  SessionInfo info_;
};

TEST_F(StreamingWriteHandlerTest, WritesBodyAndReturnsAbsolutePath) {
  const auto dest = root_ / "out.bin";
  const std::string bytes = make_bytes(200000);

  auto res = client().Put(target(dest), bytes, "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->body, dest.string());
  EXPECT_EQ(read_file(dest), bytes);
  EXPECT_EQ(bw::test::count_temp_files(root_), 0);
}

TEST_F(StreamingWriteHandlerTest, EmptyBodyCreatesEmptyFile) {
  const auto dest = root_ / "empty.bin";
  auto res = client().Put(target(dest), std::string(), "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_TRUE(fs::exists(dest));
  EXPECT_EQ(fs::file_size(dest), 0u);
}

TEST_F(StreamingWriteHandlerTest, EncodedPathSegmentsAreDecoded) {
  const auto dest = root_ / "with space & more.bin";
  auto res = client().Put(target(dest), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(read_file(dest), "abc");
}

TEST_F(StreamingWriteHandlerTest, MissingTokenIsRejectedWithoutTouchingDisk) {
  const auto dest = root_ / "nested" / "out.bin";
  auto res = client(false).Put(target(dest, "true"), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  EXPECT_EQ(kind_of(res), "auth");
  EXPECT_FALSE(fs::exists(root_ / "nested"));
}

TEST_F(StreamingWriteHandlerTest, WrongTokenIsRejected) {
  const auto dest = root_ / "out.bin";
  httplib::Client cli(info_.bindAddress, info_.port);
  cli.set_bearer_token_auth(std::string(info_.token.size(), '0'));
  auto res = cli.Put(target(dest), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 401);
  EXPECT_FALSE(fs::exists(dest));
}

TEST_F(StreamingWriteHandlerTest, MissingParentWithoutRecursiveIsConflict) {
  const auto dest = root_ / "a" / "b" / "out.bin";
  auto res = client().Put(target(dest, "false"), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 409);
  EXPECT_EQ(kind_of(res), "directory_missing");
  EXPECT_FALSE(fs::exists(root_ / "a"));
}

TEST_F(StreamingWriteHandlerTest, RecursiveCreatesNestedParents) {
  const auto dest = root_ / "a" / "b" / "c" / "out.bin";
  auto res = client().Put(target(dest, "true"), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(read_file(dest), "abc");
}

TEST_F(StreamingWriteHandlerTest, RecursiveFlagMustBeBoolean) {
  const auto dest = root_ / "out.bin";
  auto res = client().Put(target(dest, "yes"), "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_FALSE(fs::exists(dest));
}

TEST_F(StreamingWriteHandlerTest, TraversalIsRejected) {
  const std::string t = percent_encode_path(root_.string()) + "/%2E%2E/escape.bin?recursive=false";
  auto res = client().Put(t, "abc", "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_FALSE(fs::exists(root_.parent_path() / "escape.bin"));
}

TEST_F(StreamingWriteHandlerTest, BodyWithoutContentLengthIsRejected) {
  const auto dest = root_ / "out.bin";
  auto res = client().Put(
      target(dest),
      httplib::Headers{},
      [](size_t, httplib::DataSink& sink) {
        sink.write("abc", 3);
        sink.done();
        return true;
      },
      "application/octet-stream");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_FALSE(fs::exists(dest));
}

TEST_F(StreamingWriteHandlerTest, RepeatedWritesReplaceContent) {
  const auto dest = root_ / "out.bin";
  ASSERT_EQ(client().Put(target(dest), std::string(50000, 'L'), "application/octet-stream")->status, 200);
  ASSERT_EQ(client().Put(target(dest), "short", "application/octet-stream")->status, 200);
  EXPECT_EQ(read_file(dest), "short");
}

TEST_F(StreamingWriteHandlerTest, InterruptedUploadNeverShowsPartialFile) {
  const auto fresh = root_ / "fresh.bin";
  const auto existing = root_ / "existing.bin";
  write_file(existing, "previous content");

  for (const auto& dest : {fresh, existing}) {
    const std::string chunk(64 * 1024, 'p');
    auto res = client().Put(
        target(dest),
        httplib::Headers{},
        1024 * 1024,
        [&](size_t offset, size_t, httplib::DataSink& sink) {
          if (offset >= chunk.size()) return false;  // drop the connection mid-body
          return sink.write(chunk.data(), chunk.size());
        },
        "application/octet-stream");
    EXPECT_FALSE(res);
  }

  // The server notices the close asynchronously; wait for its cleanup.
  for (int i = 0; i < 100 && bw::test::count_temp_files(root_) > 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  EXPECT_EQ(bw::test::count_temp_files(root_), 0);
  EXPECT_FALSE(fs::exists(fresh));
  EXPECT_EQ(read_file(existing), "previous content");
}
