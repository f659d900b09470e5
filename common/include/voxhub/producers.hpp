#pragma once

#include "voxhub/event.hpp"

#include <string>

namespace voxhub {

class Hub;

// Fan-out helpers for the persistence side (REST handlers, storage). Full
// message payloads stay channel-scoped; everyone else gets a small digest.

static constexpr std::size_t ACTIVITY_PREVIEW_MAX = 120;

// message.new to the channel's viewers plus a global message.activity digest.
// `message` carries at least id, user_id, content and optionally
// author.username. An empty channel_name falls back to the channel id.
void publish_message_new(Hub &hub, const std::string &channel_id,
                         const json &message,
                         const std::string &channel_name = {});
void publish_message_edit(Hub &hub, const std::string &channel_id,
                          const json &message);
void publish_message_delete(Hub &hub, const std::string &channel_id,
                            const std::string &message_id);
// `reactions` is the full recomputed list, never a delta.
void publish_reaction_update(Hub &hub, const std::string &channel_id,
                             const std::string &message_id,
                             const json &reactions);
// Roster and structure changes (channel.*, category.*, member.new, emoji.*).
void publish_global(Hub &hub, const std::string &type, const json &data);

// Routes a producer envelope received over the internal endpoint:
//   {"scope": "global"|"channel"|"user"|"room", "target": <id>,
//    "type": <event type>, "data": <payload>, "channel_name": <optional>}
// "target" is required for every scope but global. message.new on a channel
// goes through publish_message_new. Returns false for a malformed envelope.
bool publish_envelope(Hub &hub, const json &envelope);

// First `max_chars` code points of `content`, with "…" appended when cut.
std::string activity_preview(const std::string &content,
                             std::size_t max_chars = ACTIVITY_PREVIEW_MAX);

} // namespace voxhub
