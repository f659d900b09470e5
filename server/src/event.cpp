#include "voxhub/event.hpp"

namespace voxhub {

Frame Event::frame() const {
  json envelope = {{"type", type}, {"data", data}};
  return std::make_shared<const std::string>(
      envelope.dump(-1, ' ', false, json::error_handler_t::replace));
}

Event voice_room_state(const std::string &channel_id,
                       const std::vector<std::string> &participants) {
  return {"voice.room_state",
          {{"channel_id", channel_id}, {"participants", participants}}};
}

Event voice_joined(const std::string &channel_id, const std::string &user_id) {
  return {"voice.joined", {{"channel_id", channel_id}, {"user_id", user_id}}};
}

Event voice_left(const std::string &channel_id, const std::string &user_id) {
  return {"voice.left", {{"channel_id", channel_id}, {"user_id", user_id}}};
}

Event typing_event(const std::string &channel_id, const std::string &user_id) {
  return {"typing", {{"user_id", user_id}, {"channel_id", channel_id}}};
}

Event pong_event() { return {"pong", json::object()}; }

} // namespace voxhub
