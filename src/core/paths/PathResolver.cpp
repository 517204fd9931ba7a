#include "PathResolver.hpp"

#include <cctype>
#include <string>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace bw {

namespace {

constexpr std::string_view kFileScheme = "file://";

struct DirectoryName {
  Directory dir;
  const char* name;
};

constexpr DirectoryName kDirectoryNames[] = {
  {Directory::Documents,       "DOCUMENTS"},
  {Directory::Data,            "DATA"},
  {Directory::Library,         "LIBRARY"},
  {Directory::Cache,           "CACHE"},
  {Directory::External,        "EXTERNAL"},
  {Directory::ExternalStorage, "EXTERNAL_STORAGE"},
};

bool starts_with(std::string_view s, std::string_view prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Strips the scheme and optional "localhost" authority from a file URI.
std::string uri_to_path(std::string_view uri) {
  std::string_view rest = uri.substr(kFileScheme.size());
  if (starts_with(rest, "localhost/")) rest.remove_prefix(std::string_view("localhost").size());
  if (rest.empty() || rest.front() != '/') {
    throw InvalidPathError("file URI must carry an absolute path: " + std::string(uri));
  }
  return percent_decode(rest);
}

// A directory-shaped path (trailing separator, ".", "..") cannot be a file.
void require_file_name(const fs::path& p, const std::string& original) {
  const auto name = p.filename();
  if (name.empty() || name == "." || name == "..") {
    throw InvalidPathError("path does not name a file: " + original);
  }
}

fs::path strip_trailing_separator(fs::path p) {
  if (p.filename().empty() && p.has_relative_path()) return p.parent_path();
  return p;
}

}  // namespace

const char* to_string(Directory d) {
  for (const auto& e : kDirectoryNames) {
    if (e.dir == d) return e.name;
  }
  return "UNKNOWN";
}

std::optional<Directory> parse_directory(std::string_view name) {
  std::string norm;
  for (std::size_t i = 0; i < name.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(name[i]);
    // CamelCase boundary: "ExternalStorage" -> "EXTERNAL_STORAGE"
    if (i > 0 && std::isupper(c) && std::islower(static_cast<unsigned char>(name[i - 1]))) {
      norm.push_back('_');
    }
    norm.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(c)));
  }
  for (const auto& e : kDirectoryNames) {
    if (norm == e.name) return e.dir;
  }
  return std::nullopt;
}

PathResolver::PathResolver(RootMap roots) : roots_(std::move(roots)) {
  for (auto& [dir, root] : roots_) {
    root = strip_trailing_separator(fs::absolute(root).lexically_normal());
  }
}

const fs::path& PathResolver::rootPath(Directory root) const {
  auto it = roots_.find(root);
  if (it == roots_.end()) {
    throw InvalidPathError(std::string("no location configured for directory ") + to_string(root));
  }
  return it->second;
}

ResolvedPath PathResolver::resolveFullyQualified(const std::string& path) {
  if (path.empty()) throw InvalidPathError("empty path");

  std::string raw = starts_with(path, kFileScheme) ? uri_to_path(path) : path;
  fs::path p(raw);
  if (!p.is_absolute()) {
    throw InvalidPathError("path is not fully qualified and no directory was given: " + path);
  }
  for (const auto& seg : p) {
    if (seg == "..") throw InvalidPathError("path traversal is not allowed: " + path);
  }

  fs::path abs = p.lexically_normal();
  require_file_name(abs, path);
  return {abs, abs.parent_path()};
}

ResolvedPath PathResolver::resolve(std::optional<Directory> root, const std::string& path) const {
  if (!root || starts_with(path, kFileScheme)) return resolveFullyQualified(path);
  if (path.empty()) throw InvalidPathError("empty path");

  const fs::path& base = rootPath(*root);

  // Leading separators are relative to the root, not the filesystem.
  std::string_view rel(path);
  while (!rel.empty() && rel.front() == '/') rel.remove_prefix(1);
  if (rel.empty()) throw InvalidPathError("path does not name a file: " + path);

  fs::path abs = (base / fs::path(std::string(rel))).lexically_normal();
  fs::path inside = abs.lexically_relative(base);
  if (inside.empty() || inside == "." || *inside.begin() == "..") {
    throw InvalidPathError("path escapes its directory: " + path);
  }
  require_file_name(abs, path);
  return {abs, abs.parent_path()};
}

std::string percent_encode_path(std::string_view path) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[(c >> 4) & 0xF]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

std::string percent_decode(std::string_view s) {
  auto hexval = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '%') {
      if (i + 2 >= s.size()) throw InvalidPathError("truncated percent escape");
      int hi = hexval(s[i + 1]), lo = hexval(s[i + 2]);
      if (hi < 0 || lo < 0) throw InvalidPathError("bad percent escape");
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

}  // namespace bw
