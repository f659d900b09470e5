#include "voxhub/connection.hpp"

#include "voxhub/hub.hpp"
#include "voxhub/log.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace voxhub {

// ===== SEND QUEUE
// ====================================================================
SendQueue::SendQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool SendQueue::try_push(Frame frame) {
  {
    std::scoped_lock lk(mu_);
    if (closed_ || items_.size() >= capacity_)
      return false;
    items_.push_back(std::move(frame));
  }
  cv_.notify_one();
  return true;
}

bool SendQueue::try_pop(Frame &out) {
  std::scoped_lock lk(mu_);
  if (items_.empty())
    return false;
  out = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool SendQueue::pop(Frame &out) {
  std::unique_lock lk(mu_);
  cv_.wait(lk, [this] { return closed_ || !items_.empty(); });
  if (items_.empty())
    return false;
  out = std::move(items_.front());
  items_.pop_front();
  return true;
}

bool SendQueue::close() {
  {
    std::scoped_lock lk(mu_);
    if (closed_)
      return false;
    closed_ = true;
  }
  cv_.notify_all();
  return true;
}

bool SendQueue::closed() const {
  std::scoped_lock lk(mu_);
  return closed_;
}

std::size_t SendQueue::size() const {
  std::scoped_lock lk(mu_);
  return items_.size();
}

// ===== CONNECTION
// ====================================================================
const char *to_string(ConnState s) {
  switch (s) {
  case ConnState::connecting:
    return "connecting";
  case ConnState::active:
    return "active";
  case ConnState::closing:
    return "closing";
  case ConnState::closed:
    return "closed";
  }
  return "unknown";
}

Connection::Connection(std::string user_id,
                       std::unique_ptr<Transport> transport,
                       std::size_t queue_capacity)
    : sid_(make_session_id()), user_id_(std::move(user_id)),
      transport_(std::move(transport)), queue_(queue_capacity) {
  if (!transport_)
    throw std::invalid_argument("connection requires a transport");
}

std::string Connection::remote() const { return transport_->remote(); }

std::string Connection::channel() const {
  std::scoped_lock lk(channel_mu_);
  return channel_;
}

void Connection::set_channel(std::string channel_id) {
  std::scoped_lock lk(channel_mu_);
  channel_ = std::move(channel_id);
}

void Connection::begin_closing() {
  auto expected = ConnState::active;
  state_.compare_exchange_strong(expected, ConnState::closing);
}

void Connection::run(Hub &hub) {
  auto self = shared_from_this();
  hub.register_connection(self);
  auto expected = ConnState::connecting;
  state_.compare_exchange_strong(expected, ConnState::active);
  std::cerr << "[" << now_stamp() << "] [ws] connect " << remote()
            << " sid=" << sid_ << " user=" << user_id_ << "\n";

  std::thread writer([self] { self->write_pump(); });
  read_pump(hub);
  writer.join();

  transport_->close();
  state_ = ConnState::closed;
}

void Connection::read_pump(Hub &hub) {
  auto self = shared_from_this();
  std::string reason = "eof";
  while (true) {
    std::string text;
    try {
      text = transport_->read();
    } catch (const std::exception &ex) {
      reason = ex.what();
      break;
    }
    hub.handle_frame(self, text);
  }
  begin_closing();
  std::cerr << "[" << now_stamp() << "] [ws] disconnect " << remote()
            << " sid=" << sid_ << " reason=" << reason << "\n";
  hub.unregister(self);
}

void Connection::write_pump() {
  Frame frame;
  while (queue_.pop(frame)) {
    try {
      transport_->write(*frame);
    } catch (const std::exception &ex) {
      std::cerr << "[" << now_stamp() << "] [ws] write failed sid=" << sid_
                << ": " << ex.what() << "\n";
      break;
    }
  }
  begin_closing();
  // Unblocks the reader, which then unregisters.
  transport_->close();
}

} // namespace voxhub
