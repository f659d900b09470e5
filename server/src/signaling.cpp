#include "voxhub/signaling.hpp"

#include "voxhub/connection.hpp"
#include "voxhub/hub.hpp"
#include "voxhub/log.hpp"

#include <iostream>

namespace voxhub {

bool relay_signal(Hub &hub, const Connection &sender, const SignalCmd &cmd) {
  // Evaluated fresh on every relay; a peer leaving right after the check
  // just receives one stale payload.
  if (!hub.rooms().are_co_members(cmd.channel_id, sender.user_id(),
                                  cmd.target_user_id)) {
    std::cerr << "[" << now_stamp() << "] [hub] relay dropped "
              << signal_type(cmd.kind) << " sid=" << sender.sid()
              << " channel=" << cmd.channel_id << "\n";
    return false;
  }
  hub.send_to_user(cmd.target_user_id,
                   Event{signal_type(cmd.kind),
                         json{{"channel_id", cmd.channel_id},
                              {"from_user_id", sender.user_id()},
                              {"payload", cmd.payload}}});
  return true;
}

} // namespace voxhub
