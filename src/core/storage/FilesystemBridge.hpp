#pragma once
#include <string>

namespace bw {

// The generic write/append contract used by the chunked fallback. Data is
// handed over base64-encoded, the representation such bridges expect.
class FilesystemBridge {
public:
  virtual ~FilesystemBridge() = default;

  // Creates or truncates path. Missing parents are created only when
  // recursive is set; otherwise DirectoryMissingError.
  virtual void writeFile(const std::string& path, const std::string& base64, bool recursive) = 0;

  // Appends to path, creating it if absent. Parent must exist.
  virtual void appendFile(const std::string& path, const std::string& base64) = 0;
};

}  // namespace bw
