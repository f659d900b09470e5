#pragma once

#include <memory>
#include <string>

namespace sw {
namespace redis {
class Redis;
}
} // namespace sw

namespace voxhub {

// Mirrors who is online into Redis as expiring keys (online:user:<id>).
// Redis failures are logged and swallowed into "no effect"; delivery never
// depends on them.
class Presence {
public:
  Presence(std::unique_ptr<sw::redis::Redis> redis, int ttl_seconds);
  virtual ~Presence();

  // nullptr when the URL is empty or the server is unreachable.
  static std::unique_ptr<Presence> connect(const std::string &url,
                                           int ttl_seconds);

  virtual void set_online(const std::string &user_id);
  virtual void set_offline(const std::string &user_id);

  static std::string key_for(const std::string &user_id) {
    return "online:user:" + user_id;
  }

protected:
  // For subclasses that keep presence somewhere other than Redis.
  Presence();

private:
  std::unique_ptr<sw::redis::Redis> redis_;
  const int ttl_seconds_;
};

} // namespace voxhub
