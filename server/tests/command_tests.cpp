#include <voxhub/command.hpp>

#include <catch2/catch.hpp>

using namespace voxhub;

TEST_CASE("subscribe accepts a channel or an empty string", "[command]") {
  auto cmd = parse_command(R"({"type":"subscribe","data":{"channel_id":"c1"}})");
  REQUIRE(cmd);
  REQUIRE(std::get<SubscribeCmd>(*cmd).channel_id == "c1");

  cmd = parse_command(R"({"type":"subscribe","data":{"channel_id":""}})");
  REQUIRE(cmd);
  REQUIRE(std::get<SubscribeCmd>(*cmd).channel_id.empty());

  cmd = parse_command(R"({"type":"subscribe","data":{}})");
  REQUIRE(cmd);
  REQUIRE(std::get<SubscribeCmd>(*cmd).channel_id.empty());
}

TEST_CASE("voice and typing commands need a channel", "[command]") {
  REQUIRE(parse_command(R"({"type":"voice.join","data":{"channel_id":"r"}})"));
  REQUIRE_FALSE(parse_command(R"({"type":"voice.join","data":{}})"));
  REQUIRE_FALSE(
      parse_command(R"({"type":"voice.leave","data":{"channel_id":""}})"));
  REQUIRE_FALSE(parse_command(R"({"type":"typing","data":{"channel_id":7}})"));

  auto cmd = parse_command(R"({"type":"voice.leave","data":{"channel_id":"r"}})");
  REQUIRE(cmd);
  REQUIRE(std::get<VoiceLeaveCmd>(*cmd).channel_id == "r");
}

TEST_CASE("signal commands keep the payload untouched", "[command]") {
  auto cmd = parse_command(R"({"type":"voice.answer","data":{
      "channel_id":"r","target_user_id":"u2",
      "payload":{"sdp":"v=0\r\n","nested":[1,2,{"x":null}]}}})");
  REQUIRE(cmd);
  const auto &sig = std::get<SignalCmd>(*cmd);
  REQUIRE(sig.kind == SignalKind::answer);
  REQUIRE(sig.channel_id == "r");
  REQUIRE(sig.target_user_id == "u2");
  REQUIRE(sig.payload ==
          json::parse(R"({"sdp":"v=0\r\n","nested":[1,2,{"x":null}]})"));
  REQUIRE(std::string(signal_type(sig.kind)) == "voice.answer");
}

TEST_CASE("signal commands need a target", "[command]") {
  REQUIRE_FALSE(parse_command(
      R"({"type":"voice.offer","data":{"channel_id":"r","payload":{}}})"));
  auto cmd = parse_command(
      R"({"type":"voice.ice","data":{"target_user_id":"u2","payload":"cand"}})");
  REQUIRE(cmd);
  REQUIRE(std::get<SignalCmd>(*cmd).kind == SignalKind::ice);
  REQUIRE(std::get<SignalCmd>(*cmd).payload == "cand");
}

TEST_CASE("media_state flags must be booleans", "[command]") {
  auto cmd = parse_command(R"({"type":"voice.media_state","data":{
      "channel_id":"r","cam_enabled":true,"screen_sharing":false}})");
  REQUIRE(cmd);
  const auto &ms = std::get<MediaStateCmd>(*cmd);
  REQUIRE(ms.cam_enabled);
  REQUIRE_FALSE(ms.screen_sharing);

  REQUIRE_FALSE(parse_command(R"({"type":"voice.media_state","data":{
      "channel_id":"r","cam_enabled":"yes"}})"));
}

TEST_CASE("ping needs no data", "[command]") {
  auto cmd = parse_command(R"({"type":"ping"})");
  REQUIRE(cmd);
  REQUIRE(std::holds_alternative<PingCmd>(*cmd));
}

TEST_CASE("malformed and unknown frames are rejected", "[command]") {
  REQUIRE_FALSE(parse_command(""));
  REQUIRE_FALSE(parse_command("{not json"));
  REQUIRE_FALSE(parse_command("[1,2,3]"));
  REQUIRE_FALSE(parse_command(R"({"data":{}})"));
  REQUIRE_FALSE(parse_command(R"({"type":42,"data":{}})"));
  REQUIRE_FALSE(parse_command(R"({"type":"subscribe","data":"c1"})"));
  REQUIRE_FALSE(parse_command(R"({"type":"typing"})"));
  REQUIRE_FALSE(parse_command(R"({"type":"message.send","data":{}})"));
}
