#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "core/blob/BlobSource.hpp"
#include "core/storage/FilesystemBridge.hpp"

namespace bw {

// 384 KiB. A multiple of 3 so every chunk but the last base64-encodes
// without padding.
constexpr std::size_t kFallbackChunkSize = 3 * 128 * 1024;

struct Chunk {
  std::size_t   index;
  std::uint64_t offset;
  std::size_t   length;
};

// Chunk boundaries over a blob of `total` bytes, produced one at a time.
// An empty blob yields a single empty chunk so the target still gets created.
class ChunkPlan {
public:
  ChunkPlan(std::uint64_t total, std::size_t chunkSize) : total_(total), chunkSize_(chunkSize) {}

  std::optional<Chunk> next();

private:
  std::uint64_t total_;
  std::size_t chunkSize_;
  std::uint64_t offset_ = 0;
  std::size_t index_ = 0;
};

// Writes a blob through FilesystemBridge one chunk at a time: the first chunk
// truncates/creates, the rest append, each call finished before the next
// chunk is read. Any failure aborts the write and may leave the file short.
class ChunkedFallbackWriter {
public:
  explicit ChunkedFallbackWriter(FilesystemBridge& bridge,
                                 std::size_t chunkSize = kFallbackChunkSize);

  std::string write(const std::filesystem::path& destination,
                    const BlobSource& blob,
                    bool recursive) const;

private:
  FilesystemBridge& bridge_;
  std::size_t chunkSize_;
};

}  // namespace bw
