#include "StreamingWriteHandler.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <optional>
#include <string>

#include "core/Errors.hpp"
#include "core/paths/PathResolver.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/storage/StagedFile.hpp"

using nlohmann::json;

namespace bw {

namespace {

void reply_error(httplib::Response& res, int status, const std::string& kind, const std::string& msg) {
  res.status = status;
  res.set_content(json({{"error", msg}, {"kind", kind}}).dump(), "application/json");
}

void reply_error(httplib::Response& res, int status, const BlobWriteError& e) {
  reply_error(res, status, e.kind(), e.what());
}

std::optional<bool> parse_recursive(const httplib::Request& req) {
  if (!req.has_param("recursive")) return false;
  const std::string v = req.get_param_value("recursive");
  if (v == "true") return true;
  if (v == "false") return false;
  return std::nullopt;
}

std::optional<std::uint64_t> parse_content_length(const httplib::Request& req) {
  if (!req.has_header("Content-Length")) return std::nullopt;
  const std::string v = req.get_header_value("Content-Length");
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) return std::nullopt;
  try {
    return std::stoull(v);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

}  // namespace

void StreamingWriteHandler::install(httplib::Server& svr) const {
  svr.Put(R"(/.*)", [handler = *this](const httplib::Request& req, httplib::Response& res,
                                      const httplib::ContentReader& content) {
    handler.handle(req, res, content);
  });
}

bool StreamingWriteHandler::authorized(const httplib::Request& req) const {
  const std::string expected = "Bearer " + token_;
  const std::string got = req.get_header_value("Authorization");
  return got.size() == expected.size() &&
         CRYPTO_memcmp(got.data(), expected.data(), expected.size()) == 0;
}

void StreamingWriteHandler::handle(const httplib::Request& req,
                                   httplib::Response& res,
                                   const httplib::ContentReader& content) const {
  if (!authorized(req)) {
    spdlog::warn("rejected streaming write: bad or missing token");
    reply_error(res, 401, "auth", "unauthorized");
    return;
  }

  const auto recursive = parse_recursive(req);
  if (!recursive) {
    reply_error(res, 400, "invalid_request", "recursive must be true or false");
    return;
  }
  const auto declared = parse_content_length(req);
  if (!declared) {
    reply_error(res, 400, "invalid_request", "Content-Length required");
    return;
  }

  ResolvedPath target;
  try {
    target = PathResolver::resolveFullyQualified(req.path);
  } catch (const InvalidPathError& e) {
    reply_error(res, 400, e);
    return;
  }

  try {
    ensure_parent_dir(target.absolute, *recursive);
  } catch (const DirectoryMissingError& e) {
    reply_error(res, 409, e);
    return;
  } catch (const BlobWriteError& e) {
    reply_error(res, 500, e);
    return;
  }

  try {
    StagedFile staged(target.absolute);
    std::optional<IoError> writeError;

    const bool complete = content([&](const char* data, size_t len) {
      try {
        staged.write(data, len);
        return true;
      } catch (const IoError& e) {
        writeError = e;
        return false;
      }
    });

    if (writeError) throw *writeError;
    if (!complete || staged.bytesWritten() != *declared) {
      // Temp file goes with `staged`; the destination is untouched.
      spdlog::warn("streaming write to {} ended after {} of {} bytes",
                   target.absolute.string(), staged.bytesWritten(), *declared);
      reply_error(res, 500, "io", "request body ended early");
      return;
    }

    staged.publish();
  } catch (const BlobWriteError& e) {
    spdlog::error("streaming write to {} failed: {}", target.absolute.string(), e.what());
    reply_error(res, 500, e);
    return;
  }

  spdlog::debug("streamed {} bytes to {}", *declared, target.absolute.string());
  res.status = 200;
  res.set_content(target.absolute.string(), "text/plain");
}

}  // namespace bw
