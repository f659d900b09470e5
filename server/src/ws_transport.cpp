#include "voxhub/ws_transport.hpp"

namespace voxhub {

WsTransport::WsTransport(tcp::socket socket) : ws_(std::move(socket)) {
  boost::system::error_code ec;
  auto ep = ws_.next_layer().remote_endpoint(ec);
  remote_ = ec ? std::string("?")
               : ep.address().to_string() + ":" + std::to_string(ep.port());
}

void WsTransport::accept(const http::request<http::string_body> &req,
                         std::size_t read_limit) {
  ws_.read_message_max(read_limit);
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &res) {
        res.set(http::field::server, "voxhub");
      }));
  ws_.accept(req);
}

std::string WsTransport::read() {
  buffer_.consume(buffer_.size());
  ws_.read(buffer_);
  return beast::buffers_to_string(buffer_.data());
}

void WsTransport::write(const std::string &frame) {
  std::scoped_lock lk(write_mu_);
  if (closed_)
    throw beast::system_error(net::error::not_connected);
  ws_.text(true);
  ws_.write(net::buffer(frame));
}

void WsTransport::close() noexcept {
  if (closed_.exchange(true))
    return;
  // Shutting the socket down wakes a reader blocked in ws_.read().
  boost::system::error_code ec;
  beast::get_lowest_layer(ws_).shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace voxhub
