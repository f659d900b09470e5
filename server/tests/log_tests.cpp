#include <voxhub/log.hpp>

#include <catch2/catch.hpp>

#include <cctype>
#include <set>
#include <string>

using namespace voxhub;

TEST_CASE("log stamps carry milliseconds", "[log]") {
  auto s = now_stamp();
  REQUIRE(s.size() == 23);
  REQUIRE(s[4] == '-');
  REQUIRE(s[10] == ' ');
  REQUIRE(s[19] == '.');
  for (auto i : {20, 21, 22})
    REQUIRE(std::isdigit(static_cast<unsigned char>(s[i])));
}

TEST_CASE("session ids are sequenced and distinct", "[log]") {
  std::set<std::string> seen;
  unsigned long last = 0;
  for (int i = 0; i < 1000; ++i) {
    auto id = make_session_id();
    auto dash = id.find('-');
    REQUIRE(dash != std::string::npos);
    REQUIRE(id.size() - dash - 1 == 8);
    auto n = std::stoul(id.substr(0, dash));
    REQUIRE(n > last);
    last = n;
    seen.insert(id);
  }
  REQUIRE(seen.size() == 1000);
}
