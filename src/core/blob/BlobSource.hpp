#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace bw {

// Byte source with a known length. Reads are positional so the same blob can
// be streamed once and then replayed by the fallback path.
class BlobSource {
public:
  virtual ~BlobSource() = default;

  virtual std::uint64_t size() const = 0;

  // Copies up to len bytes starting at offset into out and returns the count.
  // Returns 0 only at or past the end. Throws IoError on read failure.
  virtual std::size_t read(std::uint64_t offset, char* out, std::size_t len) const = 0;
};

class MemoryBlob : public BlobSource {
public:
  explicit MemoryBlob(std::string bytes) : bytes_(std::move(bytes)) {}

  std::uint64_t size() const override { return bytes_.size(); }
  std::size_t read(std::uint64_t offset, char* out, std::size_t len) const override;

private:
  std::string bytes_;
};

// Reads lazily from a file on disk; the file is never loaded whole.
class FileBlob : public BlobSource {
public:
  explicit FileBlob(const std::filesystem::path& path);

  std::uint64_t size() const override { return size_; }
  std::size_t read(std::uint64_t offset, char* out, std::size_t len) const override;

private:
  std::filesystem::path path_;
  std::uint64_t size_;
  mutable std::ifstream in_;
  mutable std::mutex mu_;
};

}  // namespace bw
