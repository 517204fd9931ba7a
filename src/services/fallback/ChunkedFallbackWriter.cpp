#include "ChunkedFallbackWriter.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "core/Errors.hpp"
#include "core/encoding/Base64.hpp"

namespace bw {

namespace {

// BlobSource::read may return short counts; fill the whole chunk.
void read_chunk(const BlobSource& blob, const Chunk& c, char* out) {
  std::size_t done = 0;
  while (done < c.length) {
    const std::size_t n = blob.read(c.offset + done, out + done, c.length - done);
    if (n == 0) throw IoError("blob ended before its declared size");
    done += n;
  }
}

}  // namespace

std::optional<Chunk> ChunkPlan::next() {
  if (index_ > 0 && offset_ >= total_) return std::nullopt;
  Chunk c{index_, offset_, static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize_, total_ - offset_))};
  offset_ += c.length;
  ++index_;
  return c;
}

ChunkedFallbackWriter::ChunkedFallbackWriter(FilesystemBridge& bridge, std::size_t chunkSize)
  : bridge_(bridge), chunkSize_(chunkSize) {
  if (chunkSize_ == 0 || chunkSize_ % 3 != 0) {
    throw std::invalid_argument("fallback chunk size must be a positive multiple of 3");
  }
}

std::string ChunkedFallbackWriter::write(const std::filesystem::path& destination,
                                         const BlobSource& blob,
                                         bool recursive) const {
  const std::string path = destination.string();
  std::vector<char> buf(static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize_, blob.size())));

  ChunkPlan plan(blob.size(), chunkSize_);
  std::size_t chunks = 0;
  while (auto c = plan.next()) {
    read_chunk(blob, *c, buf.data());
    const std::string encoded = base64_encode(buf.data(), c->length);
    if (c->index == 0) {
      bridge_.writeFile(path, encoded, recursive);
    } else {
      bridge_.appendFile(path, encoded);
    }
    spdlog::debug("fallback chunk {} ({} bytes at {}) written to {}", c->index, c->length, c->offset, path);
    ++chunks;
  }

  spdlog::info("fallback wrote {} bytes in {} chunk(s) to {}", blob.size(), chunks, path);
  return path;
}

}  // namespace bw
