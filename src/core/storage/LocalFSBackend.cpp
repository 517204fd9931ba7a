#include "LocalFSBackend.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

#include "core/Errors.hpp"
#include "core/encoding/Base64.hpp"

namespace fs = std::filesystem;

namespace bw {

namespace {

std::string decode_or_throw(const std::string& base64, const std::string& path) {
  try {
    return base64_decode(base64);
  } catch (const std::invalid_argument& e) {
    throw IoError("invalid data for " + path + ": " + e.what());
  }
}

void write_bytes(const std::string& path, const std::string& bytes, std::ios::openmode mode) {
  std::ofstream os(path, std::ios::binary | mode);
  if (!os) throw IoError("cannot open " + path);
  os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  os.flush();
  if (!os) throw IoError("write failed on " + path);
}

}  // namespace

void ensure_parent_dir(const fs::path& file, bool recursive) {
  const fs::path dir = file.parent_path();
  if (dir.empty()) return;

  std::error_code ec;
  const auto st = fs::status(dir, ec);
  if (fs::is_directory(st)) return;
  if (fs::exists(st)) throw IoError("parent is not a directory: " + dir.string());
  if (!recursive) throw DirectoryMissingError("parent directory does not exist: " + dir.string());

  fs::create_directories(dir, ec);
  if (ec) throw IoError("cannot create " + dir.string() + ": " + ec.message());
}

void LocalFSBackend::writeFile(const std::string& path, const std::string& base64, bool recursive) {
  const std::string bytes = decode_or_throw(base64, path);
  ensure_parent_dir(path, recursive);
  write_bytes(path, bytes, std::ios::trunc);
}

void LocalFSBackend::appendFile(const std::string& path, const std::string& base64) {
  const std::string bytes = decode_or_throw(base64, path);
  ensure_parent_dir(path, false);
  write_bytes(path, bytes, std::ios::app);
}

}  // namespace bw
