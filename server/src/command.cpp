#include "voxhub/command.hpp"

namespace voxhub {

namespace {

// Absent field reads as empty; present but not a string is malformed.
bool string_field(const json &data, const char *key, std::string &out) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    out.clear();
    return true;
  }
  if (!it->is_string())
    return false;
  out = it->get<std::string>();
  return true;
}

bool bool_field(const json &data, const char *key, bool &out) {
  auto it = data.find(key);
  if (it == data.end() || it->is_null()) {
    out = false;
    return true;
  }
  if (!it->is_boolean())
    return false;
  out = it->get<bool>();
  return true;
}

bool channel_only(const json &data, bool required, std::string &channel_id) {
  if (!string_field(data, "channel_id", channel_id))
    return false;
  return !required || !channel_id.empty();
}

} // namespace

const char *signal_type(SignalKind kind) {
  switch (kind) {
  case SignalKind::offer:
    return "voice.offer";
  case SignalKind::answer:
    return "voice.answer";
  case SignalKind::ice:
    return "voice.ice";
  }
  return "voice.offer";
}

std::optional<Command> parse_command(std::string_view text) {
  json in = json::parse(text.begin(), text.end(), nullptr, false);
  if (in.is_discarded() || !in.is_object())
    return std::nullopt;

  auto type_it = in.find("type");
  if (type_it == in.end() || !type_it->is_string())
    return std::nullopt;
  const auto type = type_it->get<std::string>();

  if (type == "ping")
    return Command{PingCmd{}};

  auto data_it = in.find("data");
  if (data_it == in.end() || !data_it->is_object())
    return std::nullopt;
  const json &data = *data_it;

  if (type == "subscribe") {
    SubscribeCmd c;
    if (!channel_only(data, false, c.channel_id))
      return std::nullopt;
    return Command{std::move(c)};
  }
  if (type == "typing") {
    TypingCmd c;
    if (!channel_only(data, true, c.channel_id))
      return std::nullopt;
    return Command{std::move(c)};
  }
  if (type == "voice.join") {
    VoiceJoinCmd c;
    if (!channel_only(data, true, c.channel_id))
      return std::nullopt;
    return Command{std::move(c)};
  }
  if (type == "voice.leave") {
    VoiceLeaveCmd c;
    if (!channel_only(data, true, c.channel_id))
      return std::nullopt;
    return Command{std::move(c)};
  }
  if (type == "voice.offer" || type == "voice.answer" || type == "voice.ice") {
    SignalCmd c;
    c.kind = type == "voice.offer"    ? SignalKind::offer
             : type == "voice.answer" ? SignalKind::answer
                                      : SignalKind::ice;
    if (!string_field(data, "channel_id", c.channel_id) ||
        !string_field(data, "target_user_id", c.target_user_id) ||
        c.target_user_id.empty())
      return std::nullopt;
    if (auto p = data.find("payload"); p != data.end())
      c.payload = *p;
    return Command{std::move(c)};
  }
  if (type == "voice.media_state") {
    MediaStateCmd c;
    if (!channel_only(data, true, c.channel_id) ||
        !bool_field(data, "cam_enabled", c.cam_enabled) ||
        !bool_field(data, "screen_sharing", c.screen_sharing))
      return std::nullopt;
    return Command{std::move(c)};
  }
  return std::nullopt;
}

} // namespace voxhub
