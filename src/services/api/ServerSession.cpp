#include "ServerSession.hpp"

#include <httplib.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <limits>

#include "core/Errors.hpp"
#include "services/api/StreamingWriteHandler.hpp"

namespace bw {

namespace {

constexpr const char* kLoopback = "127.0.0.1";
constexpr std::size_t kTokenBytes = 32;

std::string to_hex(const unsigned char* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string generate_token() {
  unsigned char buf[kTokenBytes];
  if (RAND_bytes(buf, sizeof(buf)) != 1) {
    throw NetworkError("cannot generate session token: RAND_bytes failed");
  }
  return to_hex(buf, sizeof(buf));
}

}  // namespace

ServerSession::ServerSession() = default;

ServerSession::~ServerSession() {
  if (server_) server_->stop();
  if (thread_.joinable()) thread_.join();
}

ServerSession& ServerSession::instance() {
  // Stopped and joined by the destructor at process exit.
  static ServerSession session;
  return session;
}

ServerSession::State ServerSession::state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

const SessionInfo& ServerSession::acquire() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this] { return state_ != State::Starting; });
  if (state_ == State::Running) return info_;

  state_ = State::Starting;
  lock.unlock();
  try {
    start();
  } catch (const std::exception& e) {
    spdlog::error("streaming server failed to start: {}", e.what());
    lock.lock();
    state_ = State::Stopped;
    cv_.notify_all();
    throw;
  }
  lock.lock();
  state_ = State::Running;
  cv_.notify_all();
  return info_;
}

void ServerSession::start() {
  auto server = std::make_unique<httplib::Server>();
  std::string token = generate_token();

  StreamingWriteHandler(token).install(*server);
  server->set_payload_max_length((std::numeric_limits<size_t>::max)());

  const int port = server->bind_to_any_port(kLoopback);
  if (port < 0) throw NetworkError(std::string("cannot bind listener on ") + kLoopback);

  httplib::Server* raw = server.get();
  thread_ = std::thread([raw] {
    raw->listen_after_bind();
    spdlog::debug("streaming server listener exited");
  });
  raw->wait_until_ready();

  server_ = std::move(server);
  info_ = SessionInfo{port, std::move(token), kLoopback};
  spdlog::info("streaming server listening on http://{}:{}", kLoopback, port);
}

}  // namespace bw
