#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>

namespace bw {

// A temp file beside its destination. Bytes go to the temp file; publish()
// renames it over the destination in one step. A StagedFile destroyed before
// publish() removes its temp file, so the destination never holds a partial
// write.
class StagedFile {
public:
  explicit StagedFile(std::filesystem::path destination);
  ~StagedFile();

  StagedFile(const StagedFile&) = delete;
  StagedFile& operator=(const StagedFile&) = delete;

  void write(const char* data, std::size_t len);
  void publish();

  std::uint64_t bytesWritten() const { return written_; }
  const std::filesystem::path& tempPath() const { return temp_; }
  const std::filesystem::path& destination() const { return destination_; }

private:
  void discard() noexcept;

  std::filesystem::path destination_;
  std::filesystem::path temp_;
  std::ofstream out_;
  std::uint64_t written_ = 0;
  bool published_ = false;
};

}  // namespace bw
