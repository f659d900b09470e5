#include "test_support.hpp"

#include <voxhub/room_registry.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>

using namespace voxhub;

TEST_CASE("join reports who was already there", "[rooms]") {
  RoomRegistry rooms;
  auto a = make_conn("ua").conn;
  auto b = make_conn("ub").conn;
  auto b2 = make_conn("ub").conn;

  REQUIRE(rooms.join("r", b)->empty());
  REQUIRE(*rooms.join("r", b2) == std::vector<std::string>{"ub"});
  REQUIRE(*rooms.join("r", a) == std::vector<std::string>{"ub"});
  // Re-joining is a no-op that still reports the others.
  REQUIRE(*rooms.join("r", a) == std::vector<std::string>{"ub"});
  REQUIRE(rooms.members("r").size() == 3);
}

TEST_CASE("closed connections cannot join", "[rooms]") {
  RoomRegistry rooms;
  auto a = make_conn("ua").conn;
  a->close_queue();
  REQUIRE_FALSE(rooms.join("r", a).has_value());
  REQUIRE(rooms.room_count() == 0);
  REQUIRE_FALSE(rooms.contains("r", a));
}

TEST_CASE("leave reports presence and prunes empty rooms", "[rooms]") {
  RoomRegistry rooms;
  auto a = make_conn("ua").conn;
  rooms.join("r", a);
  REQUIRE(rooms.leave("r", a));
  REQUIRE_FALSE(rooms.leave("r", a));
  REQUIRE_FALSE(rooms.leave("never", a));
  REQUIRE(rooms.room_count() == 0);
  REQUIRE(rooms.snapshot().empty());
}

TEST_CASE("leave_all returns every affected room", "[rooms]") {
  RoomRegistry rooms;
  auto a = make_conn("ua").conn;
  auto b = make_conn("ub").conn;
  rooms.join("r2", a);
  rooms.join("r1", a);
  rooms.join("r1", b);

  REQUIRE(rooms.leave_all(a) == std::vector<std::string>{"r1", "r2"});
  REQUIRE(rooms.leave_all(a).empty());
  REQUIRE(rooms.room_count() == 1);
  REQUIRE(rooms.snapshot().at("r1") == std::vector<std::string>{"ub"});
}

TEST_CASE("co-membership is answered per user", "[rooms]") {
  RoomRegistry rooms;
  auto a = make_conn("ua").conn;
  auto b_tab1 = make_conn("ub").conn;
  auto b_tab2 = make_conn("ub").conn;
  rooms.join("r", a);
  rooms.join("r", b_tab1);

  REQUIRE(rooms.are_co_members("r", "ua", "ub"));
  REQUIRE(rooms.are_co_members("r", "ub", "ua"));
  REQUIRE_FALSE(rooms.are_co_members("other", "ua", "ub"));
  REQUIRE_FALSE(rooms.are_co_members("r", "ua", "uc"));

  // Another tab of ub in the room keeps ub a member.
  rooms.join("r", b_tab2);
  rooms.leave("r", b_tab1);
  REQUIRE(rooms.are_co_members("r", "ua", "ub"));
  rooms.leave("r", b_tab2);
  REQUIRE_FALSE(rooms.are_co_members("r", "ua", "ub"));
}

TEST_CASE("snapshot is sorted and never holds empty rooms", "[rooms]") {
  RoomRegistry rooms;
  std::vector<std::shared_ptr<Connection>> conns;
  for (int i = 0; i < 12; ++i)
    conns.push_back(make_conn("u" + std::to_string(i % 4)).conn);

  std::mt19937 rng(7);
  std::uniform_int_distribution<int> pick_conn(0, 11), pick_room(0, 3),
      pick_op(0, 2);
  for (int step = 0; step < 2000; ++step) {
    auto &c = conns[pick_conn(rng)];
    auto room = "r" + std::to_string(pick_room(rng));
    switch (pick_op(rng)) {
    case 0:
      rooms.join(room, c);
      break;
    case 1:
      rooms.leave(room, c);
      break;
    default:
      if (step % 10 == 0)
        rooms.leave_all(c);
      break;
    }
    for (const auto &[id, users] : rooms.snapshot()) {
      REQUIRE_FALSE(users.empty());
      REQUIRE(std::is_sorted(users.begin(), users.end()));
      REQUIRE(std::adjacent_find(users.begin(), users.end()) == users.end());
    }
  }
}

TEST_CASE("concurrent joins are all recorded", "[rooms]") {
  RoomRegistry rooms;
  constexpr int threads = 8, per_thread = 50;
  std::vector<std::shared_ptr<Connection>> conns;
  for (int i = 0; i < threads * per_thread; ++i)
    conns.push_back(make_conn("u" + std::to_string(i)).conn);

  std::vector<std::thread> pool;
  for (int t = 0; t < threads; ++t)
    pool.emplace_back([&, t] {
      for (int i = 0; i < per_thread; ++i)
        rooms.join("r", conns[t * per_thread + i]);
    });
  for (auto &th : pool)
    th.join();

  REQUIRE(rooms.members("r").size() == threads * per_thread);
  REQUIRE(rooms.snapshot().at("r").size() == threads * per_thread);
}
