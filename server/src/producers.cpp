#include "voxhub/producers.hpp"

#include "voxhub/hub.hpp"

namespace voxhub {

namespace {

json field_or_null(const json &obj, const char *key) {
  auto it = obj.find(key);
  return it == obj.end() ? json() : *it;
}

std::string string_or(const json &obj, const char *key,
                      const std::string &fallback) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string() || it->get<std::string>().empty())
    return fallback;
  return it->get<std::string>();
}

} // namespace

std::string activity_preview(const std::string &content,
                             std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < content.size(); ++i) {
    // Count UTF-8 lead bytes so a cut never splits a code point.
    if ((static_cast<unsigned char>(content[i]) & 0xC0) != 0x80) {
      if (chars == max_chars)
        return content.substr(0, i) + "\xE2\x80\xA6";
      ++chars;
    }
  }
  return content;
}

void publish_message_new(Hub &hub, const std::string &channel_id,
                         const json &message, const std::string &channel_name) {
  hub.broadcast_to_channel(channel_id, {"message.new", message});

  std::string author = "Someone";
  if (auto a = message.find("author"); a != message.end() && a->is_object())
    author = string_or(*a, "username", author);

  json activity = {
      {"channel_id", channel_id},
      {"channel_name", channel_name.empty() ? channel_id : channel_name},
      {"author_id", field_or_null(message, "user_id")},
      {"author", author},
      {"preview", activity_preview(string_or(message, "content", ""))},
      {"message_id", field_or_null(message, "id")}};
  hub.broadcast({"message.activity", activity});
}

void publish_message_edit(Hub &hub, const std::string &channel_id,
                          const json &message) {
  hub.broadcast_to_channel(channel_id, {"message.edit", message});
}

void publish_message_delete(Hub &hub, const std::string &channel_id,
                            const std::string &message_id) {
  hub.broadcast_to_channel(
      channel_id,
      {"message.delete", json{{"id", message_id}, {"channel_id", channel_id}}});
}

void publish_reaction_update(Hub &hub, const std::string &channel_id,
                             const std::string &message_id,
                             const json &reactions) {
  hub.broadcast_to_channel(channel_id,
                           {"reaction.update", json{{"message_id", message_id},
                                                    {"channel_id", channel_id},
                                                    {"reactions", reactions}}});
}

void publish_global(Hub &hub, const std::string &type, const json &data) {
  hub.broadcast({type, data});
}

bool publish_envelope(Hub &hub, const json &envelope) {
  if (!envelope.is_object())
    return false;
  auto scope = envelope.find("scope");
  auto type = envelope.find("type");
  if (scope == envelope.end() || !scope->is_string() || type == envelope.end() ||
      !type->is_string() || type->get<std::string>().empty())
    return false;

  Event ev{type->get<std::string>(), field_or_null(envelope, "data")};
  const auto s = scope->get<std::string>();
  if (s == "global") {
    hub.broadcast(ev);
    return true;
  }

  const auto target = string_or(envelope, "target", "");
  if (target.empty())
    return false;
  if (s == "channel") {
    if (ev.type == "message.new")
      publish_message_new(hub, target,
                          ev.data.is_object() ? ev.data : json::object(),
                          string_or(envelope, "channel_name", ""));
    else
      hub.broadcast_to_channel(target, ev);
  } else if (s == "user") {
    hub.send_to_user(target, ev);
  } else if (s == "room") {
    hub.broadcast_to_room(target, ev);
  } else {
    return false;
  }
  return true;
}

} // namespace voxhub
