#pragma once

#include <cstddef>
#include <string>

namespace voxhub {

// ===== CONFIG TUNABLES
// ================================================================
static constexpr unsigned short PORT_DEFAULT = 9000;
static constexpr std::size_t SEND_QUEUE_DEFAULT = 256;
static constexpr std::size_t READ_LIMIT_DEFAULT = 64 * 1024;
static constexpr int ONLINE_TTL_SECONDS_DEFAULT = 90;

struct Config {
  std::string bind_addr = "0.0.0.0";
  unsigned short port = PORT_DEFAULT;
  std::string allowed_origin;
  std::string publish_token;
  std::string redis_url;
  std::string pg_conninfo; // empty unless PGHOST/PGDATABASE/PGUSER/PGPASSWORD
  std::size_t send_queue_capacity = SEND_QUEUE_DEFAULT;
  std::size_t read_limit = READ_LIMIT_DEFAULT;
  int online_ttl_seconds = ONLINE_TTL_SECONDS_DEFAULT;

  static Config from_env();
};

// Reads KEY=VALUE lines into the environment without overriding variables
// that are already set. Missing file is not an error. Returns the number of
// variables set.
int load_dotenv(const std::string &path);

} // namespace voxhub
