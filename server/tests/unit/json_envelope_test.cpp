#include <gtest/gtest.h>

#include "broker/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = broker::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = broker::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, AuthenticateResponseFields) {
  broker::AuthenticateResponse res;
  res.valid = false;
  res.error = "invalid token";
  auto j = broker::ToJson(res);
  EXPECT_EQ(j, (nlohmann::json{{"valid", false}, {"userId", ""}, {"error", "invalid token"}}));
}

TEST(JsonEnvelopeTest, CreateRoomAndQosResponseFields) {
  broker::CreateRoomResponse room;
  room.room_id = "room-1";
  EXPECT_EQ(broker::ToJson(room), (nlohmann::json{{"roomId", "room-1"}, {"error", ""}}));

  broker::SelectQosResponse qos;
  qos.accepted = true;
  EXPECT_EQ(broker::ToJson(qos), (nlohmann::json{{"accepted", true}, {"error", ""}}));
}

TEST(JsonEnvelopeTest, LookupRoomResponseFields) {
  broker::LookupRoomResponse missing;
  auto j = broker::ToJson(missing);
  EXPECT_FALSE(j["found"].get<bool>());
  EXPECT_TRUE(j["room"].is_null());

  broker::LookupRoomResponse found;
  found.found = true;
  found.room = broker::RoomRecord{"room-1", "lobby", "u1"};
  auto f = broker::ToJson(found);
  EXPECT_EQ(f["room"]["name"], "lobby");
  EXPECT_EQ(f["room"]["ownerId"], "u1");
}
