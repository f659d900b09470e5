// =====================================================================================
// VOXHUB SERVER (Boost.Beast WebSocket) - real-time event hub + voice signaling
// =====================================================================================
//
// WHAT THIS PROCESS DOES:
//  - Accepts authenticated WebSocket connections on /ws (token checked against
//    the Postgres sessions table).
//  - Routes events: global, channel-scoped (viewed channel), voice-room-scoped,
//    user-targeted.
//  - Relays WebRTC offer/answer/ICE only between members of the same room.
//  - Serves the voice room snapshot and a producer ingress over plain HTTP.
//  - Mirrors online presence into Redis when REDIS_URL is set.
//
// =====================================================================================

#include "voxhub/config.hpp"
#include "voxhub/http_server.hpp"
#include "voxhub/hub.hpp"
#include "voxhub/log.hpp"
#include "voxhub/presence.hpp"
#include "voxhub/session_auth.hpp"

#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace voxhub;

int main() {
  try {
    if (int n = load_dotenv(".env"); n > 0)
      std::cerr << "[" << now_stamp() << "] [config] loaded " << n
                << " variable(s) from .env\n";
    const auto cfg = Config::from_env();
    std::cerr << "[" << now_stamp() << "] [config] bind=" << cfg.bind_addr
              << ":" << cfg.port << " queue=" << cfg.send_queue_capacity
              << " read_limit=" << cfg.read_limit << " origin="
              << (cfg.allowed_origin.empty() ? "<same-host>"
                                             : cfg.allowed_origin)
              << " publish=" << (cfg.publish_token.empty() ? "off" : "on")
              << "\n";

    auto presence = Presence::connect(cfg.redis_url, cfg.online_ttl_seconds);
    auto validator = PgSessionValidator::connect(cfg.pg_conninfo);

    Hub hub(presence.get());
    HttpServer server(cfg, hub, validator.get());

    net::io_context ioc;
    net::signal_set sigs(ioc, SIGINT, SIGTERM);
    sigs.async_wait([&](auto, auto) {
      std::cerr << "[" << now_stamp() << "] shutting down\n";
      server.stop();
    });
    std::thread signals([&] { ioc.run(); });

    try {
      server.run(ioc);
    } catch (const std::exception &) {
      ioc.stop();
      signals.join();
      throw;
    }
    ioc.stop();
    signals.join();

    // Session threads hold references to hub and server; close every
    // connection and wait for them before anything here is destroyed.
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(5);
    do {
      hub.close_all();
    } while (!server.wait_idle(std::chrono::milliseconds(100)) &&
             std::chrono::steady_clock::now() < deadline);
    if (auto left = server.active_sessions(); left > 0) {
      std::cerr << "[" << now_stamp() << "] " << left
                << " session(s) still open at exit\n";
      std::quick_exit(0);
    }
    return 0;
  } catch (const std::exception &ex) {
    std::cerr << "[" << now_stamp() << "] Fatal: " << ex.what() << "\n";
    return 1;
  }
}
