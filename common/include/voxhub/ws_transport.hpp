#pragma once

#include "voxhub/connection.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <mutex>
#include <string>

namespace voxhub {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Blocking Beast WebSocket stream. One thread reads while another writes;
// writes are serialized by their own mutex.
class WsTransport : public Transport {
public:
  explicit WsTransport(tcp::socket socket);

  // Completes the upgrade for an already-read HTTP request. Throws
  // beast::system_error on handshake failure.
  void accept(const http::request<http::string_body> &req,
              std::size_t read_limit);

  std::string read() override;
  void write(const std::string &frame) override;
  void close() noexcept override;
  std::string remote() const override { return remote_; }

private:
  websocket::stream<tcp::socket> ws_;
  beast::flat_buffer buffer_;
  std::mutex write_mu_;
  std::string remote_;
  std::atomic<bool> closed_{false};
};

} // namespace voxhub
