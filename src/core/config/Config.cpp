#include "Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <random>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace bw {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

std::string uuid4() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  auto rnd64 = [&]() { return static_cast<uint64_t>(rng()); };
  auto hexn = [](uint64_t v, int n) {
    static const char* k = "0123456789abcdef";
    std::string s(n, '0');
    for (int i = n - 1; i >= 0; --i) { s[i] = k[v & 0xf]; v >>= 4; }
    return s;
  };
  uint64_t a = rnd64(), b = rnd64();
  // version 4
  a = (a & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  // variant 10xx
  b = (b & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  return hexn(a >> 32, 8) + "-" + hexn((a >> 16) & 0xffffULL, 4) + "-" +
         hexn(a & 0xffffULL, 4) + "-" + hexn(b >> 48, 4) + "-" +
         hexn(b & 0xffffffffffffULL, 12);
}

void configure_logging(const std::string& level) {
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to off; keep info instead.
  if (lvl == spdlog::level::off && level != "off") {
    spdlog::warn("unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

static fs::path home_dir() {
  const std::string home = get_env_or("HOME", "");
  if (!home.empty()) return home;
  std::error_code ec;
  auto tmp = fs::temp_directory_path(ec);
  return ec ? fs::path("/tmp") : tmp;
}

static fs::path xdg_or(const char* key, const fs::path& fallback) {
  const std::string v = get_env_or(key, "");
  return v.empty() ? fallback : fs::path(v);
}

static PathResolver::RootMap defaultRoots() {
  const fs::path home = home_dir();
  const fs::path data = xdg_or("XDG_DATA_HOME", home / ".local/share") / "blobwriter";

  auto pick = [](const char* key, const fs::path& def) {
    const std::string v = get_env_or(key, "");
    return v.empty() ? def : fs::path(v);
  };

  return {
    {Directory::Documents,       pick("BW_DOCUMENTS_DIR", home / "Documents")},
    {Directory::Data,            pick("BW_DATA_DIR", data)},
    {Directory::Library,         pick("BW_LIBRARY_DIR",
                                      xdg_or("XDG_CONFIG_HOME", home / ".config") / "blobwriter")},
    {Directory::Cache,           pick("BW_CACHE_DIR",
                                      xdg_or("XDG_CACHE_HOME", home / ".cache") / "blobwriter")},
    {Directory::External,        pick("BW_EXTERNAL_DIR", data / "external")},
    {Directory::ExternalStorage, pick("BW_EXTERNAL_STORAGE_DIR", home)},
  };
}

static std::optional<std::chrono::seconds> envTimeout() {
  const std::string v = get_env_or("BW_STREAM_TIMEOUT_SEC", "");
  if (v.empty()) return std::nullopt;
  try {
    long secs = std::stol(v);
    if (secs > 0) return std::chrono::seconds(secs);
  } catch (const std::exception&) {
  }
  spdlog::warn("ignoring invalid BW_STREAM_TIMEOUT_SEC '{}'", v);
  return std::nullopt;
}

Config Config::fromEnvironment() {
  Config c;
  c.logLevel = get_env_or("BW_LOG_LEVEL", "info");
  c.roots = defaultRoots();
  c.streamTimeout = envTimeout();
  c.journalPath = get_env_or("BW_JOURNAL_PATH", "");
  return c;
}

}  // namespace bw
