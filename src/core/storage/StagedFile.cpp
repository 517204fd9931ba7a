#include "StagedFile.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <random>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace bw {

namespace {

std::string random_suffix() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  static const char* k = "0123456789abcdef";
  uint64_t v = rng();
  std::string s(16, '0');
  for (int i = 15; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
  return s;
}

// Flushes file contents to stable storage before the rename makes them visible.
void sync_file(const fs::path& p) {
  int fd = ::open(p.c_str(), O_RDONLY);
  if (fd < 0) throw IoError("cannot reopen " + p.string() + " for sync");
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) throw IoError("fsync failed on " + p.string());
}

}  // namespace

StagedFile::StagedFile(fs::path destination) : destination_(std::move(destination)) {
  temp_ = destination_.parent_path() /
          ("." + destination_.filename().string() + "." + random_suffix() + ".bwtmp");
  out_.open(temp_, std::ios::binary | std::ios::trunc);
  if (!out_) throw IoError("cannot create temp file in " + destination_.parent_path().string());
}

StagedFile::~StagedFile() {
  if (!published_) discard();
}

void StagedFile::write(const char* data, std::size_t len) {
  out_.write(data, static_cast<std::streamsize>(len));
  if (!out_) throw IoError("write failed on " + temp_.string());
  written_ += len;
}

void StagedFile::publish() {
  out_.flush();
  out_.close();
  if (out_.fail()) throw IoError("close failed on " + temp_.string());
  sync_file(temp_);

  std::error_code ec;
  fs::rename(temp_, destination_, ec);
  if (ec) throw IoError("cannot publish " + destination_.string() + ": " + ec.message());
  published_ = true;
}

void StagedFile::discard() noexcept {
  if (out_.is_open()) out_.close();
  std::error_code ec;
  fs::remove(temp_, ec);
  if (ec) spdlog::warn("could not remove temp file {}: {}", temp_.string(), ec.message());
}

}  // namespace bw
