#pragma once

#include "voxhub/event.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace voxhub {

// ===== INBOUND COMMANDS (client -> server)
// ============================================
struct SubscribeCmd {
  std::string channel_id; // empty clears the viewed channel
};
struct TypingCmd {
  std::string channel_id;
};
struct VoiceJoinCmd {
  std::string channel_id;
};
struct VoiceLeaveCmd {
  std::string channel_id;
};

enum class SignalKind { offer, answer, ice };

struct SignalCmd {
  SignalKind kind = SignalKind::offer;
  std::string channel_id;
  std::string target_user_id;
  json payload; // opaque SDP / ICE blob, never inspected
};

struct MediaStateCmd {
  std::string channel_id;
  bool cam_enabled = false;
  bool screen_sharing = false;
};

struct PingCmd {};

using Command = std::variant<SubscribeCmd, TypingCmd, VoiceJoinCmd,
                             VoiceLeaveCmd, SignalCmd, MediaStateCmd, PingCmd>;

// Decodes one text frame. Returns nullopt for bad JSON, a missing or unknown
// type tag, non-object data, or a missing/mistyped required field.
std::optional<Command> parse_command(std::string_view text);

// "voice.offer" / "voice.answer" / "voice.ice"
const char *signal_type(SignalKind kind);

} // namespace voxhub
