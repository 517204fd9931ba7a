#pragma once
#include <chrono>
#include <optional>
#include <string>

#include "core/paths/PathResolver.hpp"

namespace bw {

std::string get_env_or(const char* key, const std::string& defval);

// Random RFC 4122 v4 id; used to key journal rows.
std::string uuid4();

// Applies a spdlog level name (trace, debug, info, warn, error, off).
void configure_logging(const std::string& level);

struct Config {
  std::string logLevel = "info";
  PathResolver::RootMap roots;
  std::optional<std::chrono::seconds> streamTimeout;  // unset: HTTP client defaults
  std::string journalPath;                            // empty: journal disabled

  // Reads the BW_* environment variables.
  static Config fromEnvironment();
};

}  // namespace bw
