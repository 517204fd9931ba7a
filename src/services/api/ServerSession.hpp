#pragma once
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace bw {

struct SessionInfo {
  int port = 0;
  std::string token;
  std::string bindAddress;
};

// Loopback HTTP listener serving StreamingWriteHandler. Started lazily on the
// first acquire() and kept running from then on; every caller shares the same
// port and token.
class ServerSession {
public:
  enum class State { Stopped, Starting, Running };

  ServerSession();
  ~ServerSession();

  ServerSession(const ServerSession&) = delete;
  ServerSession& operator=(const ServerSession&) = delete;

  // Starts the listener if needed. Concurrent callers during start-up block
  // until it is running and all see the same session. Throws NetworkError if
  // the listener cannot be bound; a later call retries.
  const SessionInfo& acquire();

  State state() const;

  // The process-wide session. Never destroyed.
  static ServerSession& instance();

private:
  void start();

  mutable std::mutex mu_;
  std::condition_variable cv_;
  State state_ = State::Stopped;
  SessionInfo info_;
  std::unique_ptr<httplib::Server> server_;
  std::thread thread_;
};

}  // namespace bw
