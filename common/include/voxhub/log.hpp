#pragma once

#include <string>

namespace voxhub {

// Local wall-clock time as "YYYY-mm-dd HH:MM:SS.mmm", the log line prefix.
std::string now_stamp();

// "<n>-<8 hex>": n counts connections since start, the suffix keeps ids
// distinct across restarts. Identifies one connection in log lines.
std::string make_session_id();

} // namespace voxhub
