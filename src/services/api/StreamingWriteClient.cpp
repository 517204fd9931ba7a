#include "StreamingWriteClient.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <vector>

#include "core/Errors.hpp"
#include "core/paths/PathResolver.hpp"

using nlohmann::json;

namespace bw {

namespace {

constexpr std::size_t kStreamBufferSize = 64 * 1024;

// Server errors carry {"error": ...}; fall back to the raw body.
std::string error_message(const httplib::Response& res) {
  auto j = json::parse(res.body, nullptr, false);
  if (j.is_object() && j.contains("error") && j["error"].is_string()) {
    return j["error"].get<std::string>();
  }
  return res.body.empty() ? "HTTP " + std::to_string(res.status) : res.body;
}

[[noreturn]] void throw_for_status(const httplib::Response& res) {
  const std::string msg = error_message(res);
  switch (res.status) {
    case 401: throw AuthError("streaming write rejected: " + msg);
    case 409: throw DirectoryMissingError(msg);
    case 500: throw IoError("streaming write failed on server: " + msg);
    default:
      throw NetworkError("streaming write returned HTTP " + std::to_string(res.status) + ": " + msg);
  }
}

}  // namespace

std::string build_write_target(const std::filesystem::path& destination, bool recursive) {
  std::string target = percent_encode_path(destination.generic_string());
  if (target.empty() || target.front() != '/') target.insert(target.begin(), '/');
  target += recursive ? "?recursive=true" : "?recursive=false";
  return target;
}

std::string StreamingWriteClient::put(const std::filesystem::path& destination,
                                      const BlobSource& blob,
                                      bool recursive) const {
  httplib::Client cli(session_.bindAddress, session_.port);
  cli.set_bearer_token_auth(session_.token);
  if (timeout_) {
    const auto secs = static_cast<time_t>(timeout_->count());
    cli.set_connection_timeout(secs, 0);
    cli.set_read_timeout(secs, 0);
    cli.set_write_timeout(secs, 0);
  }

  using Clock = std::chrono::steady_clock;
  // Start of the socket operation that is currently blocking: the request
  // itself, then each body write, then the wait for the response.
  Clock::time_point lastProgress = Clock::now();

  std::vector<char> buf(kStreamBufferSize);
  std::exception_ptr readError;
  auto provider = [&](size_t offset, size_t length, httplib::DataSink& sink) {
    try {
      const size_t n = blob.read(offset, buf.data(), std::min(length, buf.size()));
      if (n == 0) throw IoError("blob ended before its declared size");
      lastProgress = Clock::now();
      const bool ok = sink.write(buf.data(), n);
      if (ok) lastProgress = Clock::now();
      return ok;
    } catch (const std::exception&) {
      readError = std::current_exception();
      return false;
    }
  };

  const std::string target = build_write_target(destination, recursive);
  spdlog::debug("streaming {} bytes to {}", blob.size(), destination.string());
  auto res = cli.Put(target, httplib::Headers{}, static_cast<size_t>(blob.size()),
                     provider, "application/octet-stream");

  if (readError) std::rethrow_exception(readError);
  if (!res) {
    const auto err = res.error();
    if (err == httplib::Error::ConnectionTimeout) {
      throw TimeoutError("streaming write timed out connecting to the local server");
    }
    // httplib reports a socket timeout as a plain Read/Write error. With an
    // explicit timeout, a failure that took at least that long since the last
    // progress is the timeout firing.
    if (timeout_ && (err == httplib::Error::Read || err == httplib::Error::Write) &&
        Clock::now() - lastProgress >= *timeout_) {
      throw TimeoutError("streaming write timed out after " +
                         std::to_string(timeout_->count()) + "s without progress (" +
                         httplib::to_string(err) + ")");
    }
    throw NetworkError("streaming write failed: " + httplib::to_string(err));
  }
  if (res->status != 200) throw_for_status(*res);
  if (res->body.empty()) throw NetworkError("streaming write returned an empty path");
  return res->body;
}

}  // namespace bw
