#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace voxhub {

using json = nlohmann::json;

// One serialized wire frame, shared by every recipient of a delivery.
using Frame = std::shared_ptr<const std::string>;

// Outbound envelope: {"type": <type>, "data": <data>}.
struct Event {
  std::string type;
  json data;

  Event() = default;
  Event(std::string t, json d) : type(std::move(t)), data(std::move(d)) {}

  // Serializes the envelope. Invalid UTF-8 in string values is replaced
  // rather than thrown on, so a producer can never break a broadcast.
  Frame frame() const;
};

// ===== SERVER EVENT BUILDERS
// ==========================================================
Event voice_room_state(const std::string &channel_id,
                       const std::vector<std::string> &participants);
Event voice_joined(const std::string &channel_id, const std::string &user_id);
Event voice_left(const std::string &channel_id, const std::string &user_id);
Event typing_event(const std::string &channel_id, const std::string &user_id);
Event pong_event();

} // namespace voxhub
