#pragma once

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace voxhub {

class Connection;

// Voice/video room membership, keyed by channel id. Membership is per
// connection; queries answer per user. Empty rooms are pruned inline, so
// every entry always has at least one member.
class RoomRegistry {
public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Adds conn to the room and returns the users that were already in it
  // (sorted, deduplicated, excluding conn itself). nullopt, and no change,
  // when conn's send queue is already closed.
  std::optional<std::vector<std::string>> join(const std::string &channel_id,
                                               const ConnPtr &conn);
  bool leave(const std::string &channel_id, const ConnPtr &conn);
  // Removes conn from every room; returns the affected channel ids, sorted.
  std::vector<std::string> leave_all(const ConnPtr &conn);

  bool are_co_members(const std::string &channel_id, const std::string &user_a,
                      const std::string &user_b) const;
  bool contains(const std::string &channel_id, const ConnPtr &conn) const;

  // Copy of the room's connections, for delivery outside the lock.
  std::vector<ConnPtr> members(const std::string &channel_id) const;

  std::map<std::string, std::vector<std::string>> snapshot() const;
  std::size_t room_count() const;

private:
  std::unordered_map<std::string, std::unordered_set<ConnPtr>> rooms_;
  mutable std::shared_mutex mu_;
};

} // namespace voxhub
