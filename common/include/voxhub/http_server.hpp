#pragma once

#include "voxhub/config.hpp"
#include "voxhub/session_auth.hpp"
#include "voxhub/ws_transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace voxhub {

class Hub;

static constexpr const char *TOKEN_COOKIE = "voxhub_token";

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// Token from the voxhub_token cookie, else from "Authorization: Bearer".
std::string extract_token(const Request &req);

// No Origin header (non-browser client) is allowed. Otherwise the origin must
// equal `allowed`, or, when `allowed` is empty, match the Host header.
bool origin_allowed(const Request &req, const std::string &allowed);

// Path part of the request target, query string dropped.
std::string request_path(const Request &req);

// Serves the WebSocket endpoint and the small HTTP surface next to it. One
// detached thread per accepted socket; the WebSocket thread becomes the
// connection's reader.
//
//   GET  /ws               upgrade (token + origin checked first)
//   GET  /api/voice/rooms  room snapshot
//   POST /internal/events  producer ingress (X-Publish-Token)
class HttpServer {
public:
  HttpServer(const Config &cfg, Hub &hub, TokenValidator *validator);

  // Binds and accepts until stop(). Throws on bind/listen failure.
  void run(net::io_context &ioc);
  void stop();

  // Waits for every per-socket thread to finish. False on timeout.
  bool wait_idle(std::chrono::milliseconds timeout);
  std::size_t active_sessions() const;

  // Everything except the upgrade itself.
  Response handle(const Request &req);

private:
  void serve(tcp::socket socket);
  void upgrade(tcp::socket socket, const Request &req, const std::string &who);
  std::optional<Identity> authenticate(const Request &req);

  Response voice_rooms(const Request &req);
  Response publish(const Request &req);

  const Config cfg_;
  Hub &hub_;
  TokenValidator *validator_;
  std::atomic<bool> stopping_{false};
  std::atomic<int> listen_fd_{-1};

  mutable std::mutex sessions_mu_;
  std::condition_variable sessions_cv_;
  std::size_t sessions_ = 0;
};

} // namespace voxhub
