#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "core/blob/BlobSource.hpp"
#include "services/api/ServerSession.hpp"

namespace bw {

// "/<percent-encoded absolute path>?recursive=<true|false>"
std::string build_write_target(const std::filesystem::path& destination, bool recursive);

// Caller side of the streaming write: one authenticated PUT per call, body
// streamed from the blob. No retries.
class StreamingWriteClient {
public:
  explicit StreamingWriteClient(SessionInfo session,
                                std::optional<std::chrono::seconds> timeout = std::nullopt)
    : session_(std::move(session)), timeout_(timeout) {}

  // Returns the absolute path the server wrote. Throws AuthError (401),
  // DirectoryMissingError (409), IoError (500), TimeoutError, or
  // NetworkError (anything else).
  std::string put(const std::filesystem::path& destination,
                  const BlobSource& blob,
                  bool recursive) const;

private:
  SessionInfo session_;
  std::optional<std::chrono::seconds> timeout_;
};

}  // namespace bw
