#include "voxhub/presence.hpp"

#include "voxhub/log.hpp"

#include <sw/redis++/redis++.h>

#include <chrono>
#include <iostream>

namespace voxhub {

Presence::Presence(std::unique_ptr<sw::redis::Redis> redis, int ttl_seconds)
    : redis_(std::move(redis)), ttl_seconds_(ttl_seconds) {}

Presence::Presence() : ttl_seconds_(0) {}

Presence::~Presence() = default;

std::unique_ptr<Presence> Presence::connect(const std::string &url,
                                            int ttl_seconds) {
  if (url.empty()) {
    std::cerr << "[" << now_stamp() << "] [redis] disabled (REDIS_URL not set)\n";
    return nullptr;
  }
  try {
    auto redis = std::make_unique<sw::redis::Redis>(url);
    redis->ping();
    std::cerr << "[" << now_stamp() << "] [redis] connected\n";
    return std::make_unique<Presence>(std::move(redis), ttl_seconds);
  } catch (const sw::redis::Error &ex) {
    std::cerr << "[" << now_stamp() << "] [redis] disabled: " << ex.what()
              << "\n";
    return nullptr;
  }
}

void Presence::set_online(const std::string &user_id) {
  try {
    redis_->setex(key_for(user_id), std::chrono::seconds(ttl_seconds_), "1");
  } catch (const sw::redis::Error &ex) {
    std::cerr << "[" << now_stamp() << "] [redis] setex failed: " << ex.what()
              << "\n";
  }
}

void Presence::set_offline(const std::string &user_id) {
  try {
    redis_->del(key_for(user_id));
  } catch (const sw::redis::Error &ex) {
    std::cerr << "[" << now_stamp() << "] [redis] del failed: " << ex.what()
              << "\n";
  }
}

} // namespace voxhub
