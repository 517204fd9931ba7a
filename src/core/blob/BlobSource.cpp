#include "BlobSource.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>

#include "core/Errors.hpp"

namespace bw {

std::size_t MemoryBlob::read(std::uint64_t offset, char* out, std::size_t len) const {
  if (offset >= bytes_.size()) return 0;
  const std::size_t n = std::min<std::uint64_t>(len, bytes_.size() - offset);
  std::memcpy(out, bytes_.data() + offset, n);
  return n;
}

FileBlob::FileBlob(const std::filesystem::path& path) : path_(path), size_(0) {
  std::error_code ec;
  size_ = std::filesystem::file_size(path_, ec);
  if (ec) throw IoError("cannot stat " + path_.string() + ": " + ec.message());
  in_.open(path_, std::ios::binary);
  if (!in_) throw IoError("cannot open " + path_.string());
}

std::size_t FileBlob::read(std::uint64_t offset, char* out, std::size_t len) const {
  if (offset >= size_) return 0;
  const std::size_t n = std::min<std::uint64_t>(len, size_ - offset);

  std::lock_guard<std::mutex> lock(mu_);
  in_.clear();
  in_.seekg(static_cast<std::streamoff>(offset));
  in_.read(out, static_cast<std::streamsize>(n));
  const auto got = static_cast<std::size_t>(in_.gcount());
  if (got == 0 && n > 0) {
    throw IoError("read failed on " + path_.string() + " at offset " + std::to_string(offset));
  }
  return got;
}

}  // namespace bw
