#pragma once

#include "voxhub/config.hpp"
#include "voxhub/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace voxhub {

class Hub;

// Bounded outbound queue. Producers never block: try_push fails when the queue
// is full or closed. Once closed, nothing more is accepted; pop() keeps
// handing out what was already queued and then reports the end.
class SendQueue {
public:
  explicit SendQueue(std::size_t capacity = SEND_QUEUE_DEFAULT);

  bool try_push(Frame frame);
  bool try_pop(Frame &out);
  // Blocks until a frame is available or the queue is closed and drained.
  bool pop(Frame &out);
  // True only for the call that actually closed the queue.
  bool close();

  bool closed() const;
  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Frame> items_;
  const std::size_t capacity_;
  bool closed_ = false;
};

// Message-oriented duplex channel under a connection. read() and write() throw
// (std::exception derivatives) on EOF or failure; close() unblocks a pending
// read() and may be called any number of times.
class Transport {
public:
  virtual ~Transport() = default;

  virtual std::string read() = 0;
  virtual void write(const std::string &frame) = 0;
  virtual void close() noexcept = 0;
  virtual std::string remote() const = 0;
};

enum class ConnState { connecting, active, closing, closed };

const char *to_string(ConnState s);

// One authenticated client. The hub holds it for routing; the connection owns
// its send queue and its transport.
class Connection : public std::enable_shared_from_this<Connection> {
public:
  Connection(std::string user_id, std::unique_ptr<Transport> transport,
             std::size_t queue_capacity = SEND_QUEUE_DEFAULT);

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  const std::string &sid() const { return sid_; }
  const std::string &user_id() const { return user_id_; }
  std::string remote() const;

  std::string channel() const;
  void set_channel(std::string channel_id);

  // Non-blocking; false means full or closed and the caller treats the
  // connection as dead.
  bool enqueue(const Frame &frame) { return queue_.try_push(frame); }
  bool close_queue() { return queue_.close(); }
  SendQueue &outbound() { return queue_; }

  ConnState state() const { return state_.load(); }

  // Registers with the hub, runs the writer on its own thread and the reader
  // on the calling thread. Returns once both have finished and the
  // connection is Closed.
  void run(Hub &hub);

private:
  void read_pump(Hub &hub);
  void write_pump();
  void begin_closing();

  const std::string sid_;
  const std::string user_id_;
  std::unique_ptr<Transport> transport_;
  SendQueue queue_;

  mutable std::mutex channel_mu_;
  std::string channel_;

  std::atomic<ConnState> state_{ConnState::connecting};
};

} // namespace voxhub
