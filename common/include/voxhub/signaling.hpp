#pragma once

#include "voxhub/command.hpp"

namespace voxhub {

class Connection;
class Hub;

// Forwards an offer/answer/ICE payload to every connection of the target user,
// wrapped with the sender's user id, but only while sender and target are both
// in the named voice room. A failed check is dropped without telling the
// sender. Returns whether the payload was forwarded.
bool relay_signal(Hub &hub, const Connection &sender, const SignalCmd &cmd);

} // namespace voxhub
