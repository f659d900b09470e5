#include "voxhub/room_registry.hpp"

#include "voxhub/connection.hpp"

#include <algorithm>
#include <mutex>
#include <set>

namespace voxhub {

namespace {

std::vector<std::string>
user_ids(const std::unordered_set<RoomRegistry::ConnPtr> &room,
         const Connection *skip = nullptr) {
  std::set<std::string> uniq;
  for (const auto &c : room)
    if (c.get() != skip)
      uniq.insert(c->user_id());
  return {uniq.begin(), uniq.end()};
}

} // namespace

std::optional<std::vector<std::string>>
RoomRegistry::join(const std::string &channel_id, const ConnPtr &conn) {
  std::unique_lock lk(mu_);
  // Unregister closes the queue before leave_all, so a closed queue seen
  // under this lock means leave_all has run or will find nothing to undo.
  if (conn->outbound().closed())
    return std::nullopt;
  auto &room = rooms_[channel_id];
  auto existing = user_ids(room, conn.get());
  room.insert(conn);
  return existing;
}

bool RoomRegistry::leave(const std::string &channel_id, const ConnPtr &conn) {
  std::unique_lock lk(mu_);
  auto it = rooms_.find(channel_id);
  if (it == rooms_.end() || it->second.erase(conn) == 0)
    return false;
  if (it->second.empty())
    rooms_.erase(it);
  return true;
}

std::vector<std::string> RoomRegistry::leave_all(const ConnPtr &conn) {
  std::vector<std::string> affected;
  std::unique_lock lk(mu_);
  for (auto it = rooms_.begin(); it != rooms_.end();) {
    if (it->second.erase(conn) > 0) {
      affected.push_back(it->first);
      if (it->second.empty()) {
        it = rooms_.erase(it);
        continue;
      }
    }
    ++it;
  }
  std::sort(affected.begin(), affected.end());
  return affected;
}

bool RoomRegistry::are_co_members(const std::string &channel_id,
                                  const std::string &user_a,
                                  const std::string &user_b) const {
  std::shared_lock lk(mu_);
  auto it = rooms_.find(channel_id);
  if (it == rooms_.end())
    return false;
  bool found_a = false, found_b = false;
  for (const auto &c : it->second) {
    if (c->user_id() == user_a)
      found_a = true;
    if (c->user_id() == user_b)
      found_b = true;
  }
  return found_a && found_b;
}

bool RoomRegistry::contains(const std::string &channel_id,
                            const ConnPtr &conn) const {
  std::shared_lock lk(mu_);
  auto it = rooms_.find(channel_id);
  return it != rooms_.end() && it->second.count(conn) > 0;
}

std::vector<RoomRegistry::ConnPtr>
RoomRegistry::members(const std::string &channel_id) const {
  std::shared_lock lk(mu_);
  auto it = rooms_.find(channel_id);
  if (it == rooms_.end())
    return {};
  return {it->second.begin(), it->second.end()};
}

std::map<std::string, std::vector<std::string>> RoomRegistry::snapshot() const {
  std::map<std::string, std::vector<std::string>> out;
  std::shared_lock lk(mu_);
  for (const auto &[channel_id, room] : rooms_)
    out.emplace(channel_id, user_ids(room));
  return out;
}

std::size_t RoomRegistry::room_count() const {
  std::shared_lock lk(mu_);
  return rooms_.size();
}

} // namespace voxhub
