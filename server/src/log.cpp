#include "voxhub/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <random>

namespace voxhub {

std::string now_stamp() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto t = system_clock::to_time_t(now);
  const auto ms =
      duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
  return buf;
}

std::string make_session_id() {
  static std::atomic<unsigned long> seq{0};
  static thread_local std::mt19937 rng{std::random_device{}()};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lu-%08x", ++seq,
                static_cast<unsigned>(rng()));
  return buf;
}

} // namespace voxhub
