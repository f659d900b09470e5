#include "voxhub/hub.hpp"

#include "voxhub/connection.hpp"
#include "voxhub/log.hpp"
#include "voxhub/presence.hpp"
#include "voxhub/signaling.hpp"

#include <iostream>
#include <mutex>
#include <utility>

namespace voxhub {

namespace {

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

Hub::Hub(Presence *presence) : presence_(presence) {}

// ===== REGISTRATION
// ==================================================================
void Hub::register_connection(const ConnPtr &conn) {
  {
    std::unique_lock lk(mu_);
    if (clients_.insert(conn).second)
      ++user_conns_[conn->user_id()];
  }
  if (presence_) {
    std::scoped_lock plk(presence_mu_);
    if (user_connected(conn->user_id()))
      presence_->set_online(conn->user_id());
  }
}

void Hub::unregister(const ConnPtr &conn) {
  std::vector<ConnPtr> dead;
  for (const auto &channel_id : detach(conn))
    announce_left(channel_id, conn->user_id(), dead);
  evict(std::move(dead));
}

void Hub::close_all() {
  std::vector<ConnPtr> all;
  {
    std::shared_lock lk(mu_);
    all.assign(clients_.begin(), clients_.end());
  }
  for (const auto &c : all)
    unregister(c);
}

std::vector<std::string> Hub::detach(const ConnPtr &conn) {
  bool removed = false;
  {
    std::unique_lock lk(mu_);
    removed = clients_.erase(conn) > 0;
    if (removed) {
      auto it = user_conns_.find(conn->user_id());
      if (it != user_conns_.end() && --it->second == 0)
        user_conns_.erase(it);
    }
  }
  // Guarded: a second unregister, or one for a connection that never got
  // registered, leaves the queue closed exactly once. Closing before
  // leave_all keeps a racing voice.join from re-adding the connection.
  conn->close_queue();
  auto left = rooms_.leave_all(conn);

  if (removed && presence_) {
    std::scoped_lock plk(presence_mu_);
    if (!user_connected(conn->user_id()))
      presence_->set_offline(conn->user_id());
  }
  return left;
}

bool Hub::user_connected(const std::string &user_id) const {
  std::shared_lock lk(mu_);
  return user_conns_.count(user_id) > 0;
}

void Hub::evict(std::vector<ConnPtr> dead) {
  // Breadth first: every connection found dead in a round is detached before
  // that round's voice.left events go out, so they never land on it.
  while (!dead.empty()) {
    std::vector<std::pair<std::string, std::string>> departures;
    for (const auto &c : dead) {
      if (is_registered(c))
        std::cerr << "[" << now_stamp() << "] [hub] evict sid=" << c->sid()
                  << " user=" << c->user_id() << " (send queue full)\n";
      for (auto &channel_id : detach(c))
        departures.emplace_back(std::move(channel_id), c->user_id());
    }
    dead.clear();
    for (const auto &[channel_id, user_id] : departures)
      announce_left(channel_id, user_id, dead);
  }
}

std::size_t Hub::connection_count() const {
  std::shared_lock lk(mu_);
  return clients_.size();
}

bool Hub::is_registered(const ConnPtr &conn) const {
  std::shared_lock lk(mu_);
  return clients_.count(conn) > 0;
}

// ===== DELIVERY
// ======================================================================
void Hub::fan_out_all(const Frame &frame, std::vector<ConnPtr> &dead) {
  std::shared_lock lk(mu_);
  for (const auto &c : clients_)
    if (!c->enqueue(frame))
      dead.push_back(c);
}

void Hub::fan_out_room(const std::string &channel_id, const Frame &frame,
                       const Connection *exclude, std::vector<ConnPtr> &dead) {
  for (const auto &c : rooms_.members(channel_id))
    if (c.get() != exclude && !c->enqueue(frame))
      dead.push_back(c);
}

void Hub::broadcast(const Event &ev) {
  std::vector<ConnPtr> dead;
  fan_out_all(ev.frame(), dead);
  evict(std::move(dead));
}

void Hub::broadcast_to_channel(const std::string &channel_id,
                               const Event &ev) {
  // Unsubscribed connections carry an empty channel; never target them.
  if (channel_id.empty())
    return;
  auto frame = ev.frame();
  std::vector<ConnPtr> dead;
  {
    std::shared_lock lk(mu_);
    for (const auto &c : clients_)
      if (c->channel() == channel_id && !c->enqueue(frame))
        dead.push_back(c);
  }
  evict(std::move(dead));
}

void Hub::send_to_user(const std::string &user_id, const Event &ev) {
  auto frame = ev.frame();
  std::vector<ConnPtr> dead;
  {
    std::shared_lock lk(mu_);
    for (const auto &c : clients_)
      if (c->user_id() == user_id && !c->enqueue(frame))
        dead.push_back(c);
  }
  evict(std::move(dead));
}

void Hub::broadcast_to_room(const std::string &channel_id, const Event &ev,
                            const Connection *exclude) {
  std::vector<ConnPtr> dead;
  fan_out_room(channel_id, ev.frame(), exclude, dead);
  evict(std::move(dead));
}

bool Hub::send_to(const ConnPtr &conn, const Event &ev) {
  if (conn->enqueue(ev.frame()))
    return true;
  evict({conn});
  return false;
}

void Hub::announce_left(const std::string &channel_id,
                        const std::string &user_id,
                        std::vector<ConnPtr> &dead) {
  auto frame = voice_left(channel_id, user_id).frame();
  fan_out_room(channel_id, frame, nullptr, dead);
  fan_out_all(frame, dead);
}

// ===== INBOUND DISPATCH
// ==============================================================
void Hub::handle_frame(const ConnPtr &from, std::string_view text) {
  auto cmd = parse_command(text);
  if (!cmd) {
    std::cerr << "[" << now_stamp() << "] [hub] dropped frame sid="
              << from->sid() << " bytes=" << text.size() << "\n";
    return;
  }
  dispatch(from, *cmd);
}

void Hub::dispatch(const ConnPtr &from, const Command &cmd) {
  std::visit(overloaded{
                 [&](const SubscribeCmd &c) { from->set_channel(c.channel_id); },
                 [&](const TypingCmd &c) {
                   broadcast_to_channel(c.channel_id,
                                        typing_event(c.channel_id,
                                                     from->user_id()));
                 },
                 [&](const VoiceJoinCmd &c) { voice_join(from, c); },
                 [&](const VoiceLeaveCmd &c) { voice_leave(from, c); },
                 [&](const SignalCmd &c) { relay_signal(*this, *from, c); },
                 [&](const MediaStateCmd &c) { media_state(from, c); },
                 [&](const PingCmd &) { ping(from); },
             },
             cmd);
}

void Hub::voice_join(const ConnPtr &from, const VoiceJoinCmd &cmd) {
  auto existing = rooms_.join(cmd.channel_id, from);
  if (!existing)
    return;
  // A refused reply evicts the joiner, and eviction has already announced
  // its departure.
  if (!send_to(from, voice_room_state(cmd.channel_id, *existing)) ||
      !rooms_.contains(cmd.channel_id, from))
    return;

  auto ev = voice_joined(cmd.channel_id, from->user_id());
  broadcast_to_room(cmd.channel_id, ev, from.get());
  // Whole server, for sidebar occupancy.
  broadcast(ev);
}

void Hub::voice_leave(const ConnPtr &from, const VoiceLeaveCmd &cmd) {
  if (!rooms_.leave(cmd.channel_id, from))
    return;
  std::vector<ConnPtr> dead;
  announce_left(cmd.channel_id, from->user_id(), dead);
  evict(std::move(dead));
}

void Hub::media_state(const ConnPtr &from, const MediaStateCmd &cmd) {
  Event ev{"voice.media_state", json{{"channel_id", cmd.channel_id},
                                    {"from_user_id", from->user_id()},
                                    {"cam_enabled", cmd.cam_enabled},
                                    {"screen_sharing", cmd.screen_sharing}}};
  broadcast_to_room(cmd.channel_id, ev, from.get());
}

void Hub::ping(const ConnPtr &from) {
  if (presence_) {
    std::scoped_lock plk(presence_mu_);
    if (user_connected(from->user_id()))
      presence_->set_online(from->user_id());
  }
  send_to(from, pong_event());
}

} // namespace voxhub
