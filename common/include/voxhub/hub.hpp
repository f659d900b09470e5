#pragma once

#include "voxhub/command.hpp"
#include "voxhub/event.hpp"
#include "voxhub/room_registry.hpp"

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace voxhub {

class Connection;
class Presence;

// Event router: owns the set of live connections and the voice room registry,
// dispatches inbound commands, and fans events out to four audiences.
//
// Every delivery serializes the event once and enqueues without blocking. A
// connection whose queue refuses the frame is treated as dead and evicted
// after the read lock is dropped. Delivery is fire-and-forget.
class Hub {
public:
  using ConnPtr = std::shared_ptr<Connection>;

  explicit Hub(Presence *presence = nullptr);

  Hub(const Hub &) = delete;
  Hub &operator=(const Hub &) = delete;

  void register_connection(const ConnPtr &conn);
  // Idempotent. Closes the send queue at most once and emits one voice.left
  // per room the connection was still in.
  void unregister(const ConnPtr &conn);
  // Unregisters every live connection; their writers then close the
  // transports and the readers return.
  void close_all();

  void broadcast(const Event &ev);
  void broadcast_to_channel(const std::string &channel_id, const Event &ev);
  void send_to_user(const std::string &user_id, const Event &ev);
  void broadcast_to_room(const std::string &channel_id, const Event &ev,
                         const Connection *exclude = nullptr);
  // Direct reply to one connection.
  bool send_to(const ConnPtr &conn, const Event &ev);

  // Reader entry point: malformed or unknown frames are dropped.
  void handle_frame(const ConnPtr &from, std::string_view text);
  void dispatch(const ConnPtr &from, const Command &cmd);

  RoomRegistry &rooms() { return rooms_; }
  const RoomRegistry &rooms() const { return rooms_; }

  std::size_t connection_count() const;
  bool is_registered(const ConnPtr &conn) const;

private:
  void voice_join(const ConnPtr &from, const VoiceJoinCmd &cmd);
  void voice_leave(const ConnPtr &from, const VoiceLeaveCmd &cmd);
  void media_state(const ConnPtr &from, const MediaStateCmd &cmd);
  void ping(const ConnPtr &from);

  // Removes conn from the hub and every room; returns the rooms it left.
  std::vector<std::string> detach(const ConnPtr &conn);
  bool user_connected(const std::string &user_id) const;

  // Refused enqueues are appended to `dead` instead of being evicted inline.
  void fan_out_all(const Frame &frame, std::vector<ConnPtr> &dead);
  void fan_out_room(const std::string &channel_id, const Frame &frame,
                    const Connection *exclude, std::vector<ConnPtr> &dead);
  void announce_left(const std::string &channel_id, const std::string &user_id,
                     std::vector<ConnPtr> &dead);
  void evict(std::vector<ConnPtr> dead);

  Presence *presence_;
  std::unordered_set<ConnPtr> clients_;
  std::unordered_map<std::string, std::size_t> user_conns_;
  mutable std::shared_mutex mu_;
  // Orders presence writes against the connection count they were based on.
  std::mutex presence_mu_;
  RoomRegistry rooms_;
};

} // namespace voxhub
