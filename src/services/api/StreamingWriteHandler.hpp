#pragma once
#include <string>

namespace httplib {
class Server;
struct Request;
struct Response;
class ContentReader;
}

namespace bw {

// Server side of the streaming write:
//   PUT /<percent-encoded absolute path>?recursive=<true|false>
//   Authorization: Bearer <token>, Content-Length required.
// Replies 200 with the absolute path, or 400/401/409/500 with a JSON
// {"error", "kind"} body. The body goes straight to a temp file beside the
// destination and is renamed into place only once every declared byte arrived.
class StreamingWriteHandler {
public:
  explicit StreamingWriteHandler(std::string token) : token_(std::move(token)) {}

  // Registers a copy of this handler for every PUT path on svr.
  void install(httplib::Server& svr) const;

  void handle(const httplib::Request& req,
              httplib::Response& res,
              const httplib::ContentReader& content) const;

private:
  bool authorized(const httplib::Request& req) const;

  std::string token_;
};

}  // namespace bw
