#include "voxhub/http_server.hpp"

#include "voxhub/hub.hpp"
#include "voxhub/log.hpp"
#include "voxhub/producers.hpp"

#include <sys/socket.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace voxhub {

namespace {

Response respond(const Request &req, http::status status, const json &body) {
  Response res{status, req.version()};
  res.set(http::field::server, "voxhub");
  res.set(http::field::content_type, "application/json");
  res.keep_alive(false);
  res.body() = body.dump();
  res.prepare_payload();
  return res;
}

Response error_response(const Request &req, http::status status,
                        const std::string &msg) {
  return respond(req, status, {{"error", msg}});
}

std::string trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return std::string(s);
}

} // namespace

// ===== REQUEST HELPERS
// ===============================================================
std::string extract_token(const Request &req) {
  if (auto it = req.find(http::field::cookie); it != req.end()) {
    std::string_view cookies{it->value().data(), it->value().size()};
    const std::string prefix = std::string(TOKEN_COOKIE) + "=";
    while (!cookies.empty()) {
      auto semi = cookies.find(';');
      auto part = trim(cookies.substr(0, semi));
      if (part.rfind(prefix, 0) == 0 && part.size() > prefix.size())
        return part.substr(prefix.size());
      if (semi == std::string_view::npos)
        break;
      cookies.remove_prefix(semi + 1);
    }
  }
  if (auto it = req.find(http::field::authorization); it != req.end()) {
    std::string auth{it->value().data(), it->value().size()};
    if (auth.rfind("Bearer ", 0) == 0)
      return trim(std::string_view(auth).substr(7));
  }
  return {};
}

bool origin_allowed(const Request &req, const std::string &allowed) {
  auto it = req.find(http::field::origin);
  if (it == req.end() || it->value().empty())
    return true;
  std::string origin{it->value().data(), it->value().size()};
  if (!allowed.empty())
    return origin == allowed;
  auto host_it = req.find(http::field::host);
  if (host_it == req.end())
    return false;
  std::string host{host_it->value().data(), host_it->value().size()};
  return origin == "http://" + host || origin == "https://" + host;
}

std::string request_path(const Request &req) {
  std::string target{req.target().data(), req.target().size()};
  return target.substr(0, target.find('?'));
}

// ===== SERVER
// ========================================================================
HttpServer::HttpServer(const Config &cfg, Hub &hub, TokenValidator *validator)
    : cfg_(cfg), hub_(hub), validator_(validator) {}

void HttpServer::run(net::io_context &ioc) {
  tcp::endpoint ep(net::ip::make_address(cfg_.bind_addr), cfg_.port);
  tcp::acceptor acceptor(ioc);
  acceptor.open(ep.protocol());
  acceptor.set_option(net::socket_base::reuse_address(true));
  acceptor.bind(ep);
  acceptor.listen();
  listen_fd_ = acceptor.native_handle();
  std::cerr << "[" << now_stamp() << "] [http] voxhub listening on " << ep
            << "\n";

  while (!stopping_) {
    tcp::socket s(ioc);
    boost::system::error_code ec;
    acceptor.accept(s, ec);
    if (ec) {
      if (stopping_)
        break;
      std::cerr << "[" << now_stamp() << "] [http] accept error: "
                << ec.message() << "\n";
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }
    {
      std::scoped_lock lk(sessions_mu_);
      ++sessions_;
    }
    std::thread([this, sock = std::move(s)]() mutable {
      serve(std::move(sock));
      // Notify under the lock: once the count reads zero the server may be
      // destroyed.
      std::scoped_lock lk(sessions_mu_);
      --sessions_;
      sessions_cv_.notify_all();
    }).detach();
  }
  listen_fd_ = -1;
  std::cerr << "[" << now_stamp() << "] [http] listener stopped\n";
}

void HttpServer::stop() {
  stopping_ = true;
  // Wakes the blocking accept() without touching the acceptor object from
  // another thread.
  if (int fd = listen_fd_; fd >= 0)
    ::shutdown(fd, SHUT_RDWR);
}

bool HttpServer::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock lk(sessions_mu_);
  return sessions_cv_.wait_for(lk, timeout, [this] { return sessions_ == 0; });
}

std::size_t HttpServer::active_sessions() const {
  std::scoped_lock lk(sessions_mu_);
  return sessions_;
}

void HttpServer::serve(tcp::socket socket) {
  boost::system::error_code ec;
  auto ep = socket.remote_endpoint(ec);
  const auto who =
      ec ? std::string("?")
         : ep.address().to_string() + ":" + std::to_string(ep.port());
  try {
    beast::flat_buffer buffer;
    Request req;
    http::read(socket, buffer, req);

    if (websocket::is_upgrade(req)) {
      upgrade(std::move(socket), req, who);
      return;
    }
    auto res = handle(req);
    std::cerr << "[" << now_stamp() << "] [http] " << who << " "
              << req.method_string() << " " << request_path(req) << " -> "
              << res.result_int() << "\n";
    http::write(socket, res);
    socket.shutdown(tcp::socket::shutdown_send, ec);
  } catch (const beast::system_error &se) {
    std::cerr << "[" << now_stamp() << "] [http] " << who
              << " dropped: " << se.what() << "\n";
  } catch (const std::exception &ex) {
    std::cerr << "[" << now_stamp() << "] [http] " << who
              << " fatal: " << ex.what() << "\n";
  }
}

void HttpServer::upgrade(tcp::socket socket, const Request &req,
                         const std::string &who) {
  auto reject = [&](http::status status, const std::string &msg) {
    std::cerr << "[" << now_stamp() << "] [ws] reject " << who << " " << msg
              << "\n";
    http::write(socket, error_response(req, status, msg));
  };

  if (request_path(req) != "/ws")
    return reject(http::status::not_found, "not found");
  if (!origin_allowed(req, cfg_.allowed_origin))
    return reject(http::status::forbidden, "origin not allowed");
  auto id = authenticate(req);
  if (!id)
    return reject(http::status::unauthorized, "unauthorized");

  auto transport = std::make_unique<WsTransport>(std::move(socket));
  transport->accept(req, cfg_.read_limit);
  auto conn = std::make_shared<Connection>(id->user_id, std::move(transport),
                                           cfg_.send_queue_capacity);
  conn->run(hub_);
}

std::optional<Identity> HttpServer::authenticate(const Request &req) {
  if (!validator_)
    return std::nullopt;
  auto token = extract_token(req);
  if (token.empty())
    return std::nullopt;
  return validator_->validate(token);
}

// ===== ROUTES
// ========================================================================
Response HttpServer::handle(const Request &req) {
  const auto path = request_path(req);
  if (path == "/api/voice/rooms" && req.method() == http::verb::get)
    return voice_rooms(req);
  if (path == "/internal/events" && req.method() == http::verb::post)
    return publish(req);
  return error_response(req, http::status::not_found, "not found");
}

Response HttpServer::voice_rooms(const Request &req) {
  if (!authenticate(req))
    return error_response(req, http::status::unauthorized, "unauthorized");
  return respond(req, http::status::ok, {{"rooms", hub_.rooms().snapshot()}});
}

Response HttpServer::publish(const Request &req) {
  if (cfg_.publish_token.empty())
    return error_response(req, http::status::not_found, "not found");
  auto it = req.find("X-Publish-Token");
  if (it == req.end() ||
      std::string(it->value().data(), it->value().size()) !=
          cfg_.publish_token)
    return error_response(req, http::status::unauthorized, "unauthorized");

  json body = json::parse(req.body(), nullptr, false);
  if (body.is_discarded() || !publish_envelope(hub_, body))
    return error_response(req, http::status::bad_request, "malformed event");
  return respond(req, http::status::accepted, {{"ok", true}});
}

} // namespace voxhub
