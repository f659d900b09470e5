#include "test_support.hpp"

#include <catch2/catch.hpp>

#include <set>

using namespace voxhub;

// End-to-end flows over live connections: each client runs its reader and
// writer threads against an in-memory transport.

TEST_CASE("two users join a room and negotiate", "[scenario]") {
  Hub hub;
  LiveClient c1(hub, "U1");
  LiveClient c2(hub, "U2");
  LiveClient c3(hub, "U3");
  REQUIRE(wait_until([&] { return hub.connection_count() == 3; }));

  c1.send("voice.join", {{"channel_id", "R"}});
  REQUIRE(wait_until([&] { return !c1.received("voice.room_state").empty(); }));
  auto state1 = c1.received("voice.room_state");
  REQUIRE(state1[0]["data"]["channel_id"] == "R");
  REQUIRE(state1[0]["data"]["participants"] == json::array());

  c2.send("voice.join", {{"channel_id", "R"}});
  REQUIRE(wait_until([&] { return !c2.received("voice.room_state").empty(); }));
  REQUIRE(c2.received("voice.room_state")[0]["data"]["participants"] ==
          json::array({"U1"}));

  REQUIRE(wait_until([&] {
    for (const auto &e : c1.received("voice.joined"))
      if (e["data"]["user_id"] == "U2")
        return true;
    return false;
  }));

  SECTION("an outsider cannot signal into the room") {
    c3.send("voice.offer", {{"channel_id", "R"},
                            {"target_user_id", "U1"},
                            {"payload", {{"sdp", "x"}}}});
    REQUIRE(c3.sync());
    REQUIRE(c1.sync());
    REQUIRE(c1.received("voice.offer").empty());
    REQUIRE(c3.received("voice.offer").empty());
  }

  SECTION("co-members exchange offers verbatim") {
    json payload = {{"sdp", "v=0\r\n..."}, {"type", "offer"}};
    c1.send("voice.offer", {{"channel_id", "R"},
                            {"target_user_id", "U2"},
                            {"payload", payload}});
    REQUIRE(wait_until([&] { return !c2.received("voice.offer").empty(); }));
    auto offer = c2.received("voice.offer")[0]["data"];
    REQUIRE(offer["channel_id"] == "R");
    REQUIRE(offer["from_user_id"] == "U1");
    REQUIRE(offer["payload"] == payload);
  }
}

TEST_CASE("abrupt disconnect leaves every room once", "[scenario]") {
  Hub hub;
  LiveClient observer(hub, "U9");
  LiveClient c1(hub, "U1");
  REQUIRE(wait_until([&] { return hub.connection_count() == 2; }));

  c1.send("voice.join", {{"channel_id", "R1"}});
  c1.send("voice.join", {{"channel_id", "R2"}});
  REQUIRE(c1.sync());
  REQUIRE(hub.rooms().room_count() == 2);

  c1.disconnect();
  REQUIRE(c1.tc.conn->state() == ConnState::closed);
  REQUIRE(hub.connection_count() == 1);
  REQUIRE(hub.rooms().snapshot().empty());

  REQUIRE(wait_until([&] { return observer.received("voice.left").size() >= 2; }));
  REQUIRE(observer.sync());
  auto left = observer.received("voice.left");
  REQUIRE(left.size() == 2);
  std::set<std::string> rooms;
  for (const auto &e : left) {
    REQUIRE(e["data"]["user_id"] == "U1");
    rooms.insert(e["data"]["channel_id"].get<std::string>());
  }
  REQUIRE(rooms == std::set<std::string>{"R1", "R2"});
}

TEST_CASE("a second tab keeps the user reachable", "[scenario]") {
  Hub hub;
  LiveClient tab1(hub, "U1");
  LiveClient tab2(hub, "U1");
  LiveClient peer(hub, "U2");
  REQUIRE(wait_until([&] { return hub.connection_count() == 3; }));

  tab1.send("voice.join", {{"channel_id", "R"}});
  peer.send("voice.join", {{"channel_id", "R"}});
  REQUIRE(tab1.sync());
  REQUIRE(peer.sync());

  tab2.disconnect();
  peer.send("voice.ice", {{"channel_id", "R"},
                          {"target_user_id", "U1"},
                          {"payload", {{"candidate", "c0"}}}});
  REQUIRE(wait_until([&] { return !tab1.received("voice.ice").empty(); }));
  REQUIRE(tab2.received("voice.ice").empty());
}
