#include "voxhub/config.hpp"

#include "voxhub/log.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace voxhub {

namespace {

std::string env_or(const char *key, const std::string &fallback) {
  const char *v = std::getenv(key);
  return (v && *v) ? std::string(v) : fallback;
}

template <class T> T env_number(const char *key, T fallback, T min, T max) {
  const char *v = std::getenv(key);
  if (!v || !*v)
    return fallback;
  try {
    std::size_t used = 0;
    long long n = std::stoll(v, &used);
    if (used == std::string(v).size() && n >= static_cast<long long>(min) &&
        n <= static_cast<long long>(max))
      return static_cast<T>(n);
  } catch (const std::logic_error &) {
  }
  std::cerr << "[" << now_stamp() << "] [config] ignoring bad " << key << "="
            << v << ", using " << fallback << "\n";
  return fallback;
}

std::string trim(const std::string &s) {
  auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return {};
  auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

} // namespace

Config Config::from_env() {
  Config c;
  c.bind_addr = env_or("BIND_ADDR", c.bind_addr);
  c.port = env_number<unsigned short>("PORT", PORT_DEFAULT, 1, 65535);
  c.allowed_origin = env_or("ALLOWED_ORIGIN", "");
  c.publish_token = env_or("PUBLISH_TOKEN", "");
  c.redis_url = env_or("REDIS_URL", "");
  c.send_queue_capacity = env_number<std::size_t>(
      "SEND_QUEUE_CAPACITY", SEND_QUEUE_DEFAULT, 1, 1 << 20);
  c.read_limit = env_number<std::size_t>("READ_LIMIT_BYTES",
                                         READ_LIMIT_DEFAULT, 1024, 16 << 20);
  c.online_ttl_seconds = env_number<int>(
      "ONLINE_TTL_SECONDS", ONLINE_TTL_SECONDS_DEFAULT, 1, 24 * 3600);

  const char *h = std::getenv("PGHOST"), *db = std::getenv("PGDATABASE"),
             *u = std::getenv("PGUSER"), *p = std::getenv("PGPASSWORD"),
             *po = std::getenv("PGPORT");
  if (h && db && u && p)
    c.pg_conninfo = "host=" + std::string(h) + " dbname=" + db + " user=" + u +
                    " password=" + p + (po ? (" port=" + std::string(po)) : "");
  return c;
}

int load_dotenv(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return 0;
  int set = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    auto eq = line.find('=');
    if (eq == std::string::npos || eq == 0)
      continue;
    auto key = trim(line.substr(0, eq));
    auto val = trim(line.substr(eq + 1));
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\'')))
      val = val.substr(1, val.size() - 2);
    // Explicit environment always wins.
    const char *existing = std::getenv(key.c_str());
    if (existing && *existing)
      continue;
    if (::setenv(key.c_str(), val.c_str(), 1) == 0)
      ++set;
  }
  return set;
}

} // namespace voxhub
