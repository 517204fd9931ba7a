#pragma once
#include <filesystem>
#include <string>

#include "core/storage/FilesystemBridge.hpp"

namespace bw {

// FilesystemBridge over the local disk.
class LocalFSBackend : public FilesystemBridge {
public:
  void writeFile(const std::string& path, const std::string& base64, bool recursive) override;
  void appendFile(const std::string& path, const std::string& base64) override;
};

// Ensures the parent of file exists. Creates it when recursive is set, throws
// DirectoryMissingError when it is missing and recursive is not set.
void ensure_parent_dir(const std::filesystem::path& file, bool recursive);

}  // namespace bw
