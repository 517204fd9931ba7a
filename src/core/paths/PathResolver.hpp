#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace bw {

// Symbolic storage locations a caller may write under.
enum class Directory {
  Documents,
  Data,
  Library,
  Cache,
  External,
  ExternalStorage
};

const char* to_string(Directory d);
// Case-insensitive; accepts "DOCUMENTS", "external_storage", "ExternalStorage".
std::optional<Directory> parse_directory(std::string_view name);

struct ResolvedPath {
  std::filesystem::path absolute;
  std::filesystem::path parent;
};

class PathResolver {
public:
  using RootMap = std::map<Directory, std::filesystem::path>;

  explicit PathResolver(RootMap roots);

  // Maps root + path to an absolute destination. Without a root the path must
  // be absolute or a file:// URI. Throws InvalidPathError on escape or
  // malformed input. Never touches the filesystem.
  ResolvedPath resolve(std::optional<Directory> root, const std::string& path) const;

  // The no-root rules alone; used by the server on paths it receives.
  static ResolvedPath resolveFullyQualified(const std::string& path);

  const std::filesystem::path& rootPath(Directory root) const;

private:
  RootMap roots_;
};

// RFC 3986 percent coding. encode keeps '/' and unreserved characters.
std::string percent_encode_path(std::string_view path);
std::string percent_decode(std::string_view s);

}  // namespace bw
