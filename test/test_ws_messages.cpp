#include <gtest/gtest.h>

#include <string>

#include "infra/transport/ws_messages.hpp"

using transport::WsMessage;

namespace
{

    WsMessage decode(const std::string &text)
    {
        return transport::decode_ws_message(text.data(), text.size());
    }

} // namespace

TEST(WsMessagesTest, AuthFrames)
{
    EXPECT_EQ(WsMessage::Type::AuthRequired, decode(R"({"type":"auth_required","ha_version":"2024.6.0"})").type);
    EXPECT_EQ(WsMessage::Type::AuthOk, decode(R"({"type":"auth_ok"})").type);

    WsMessage invalid = decode(R"({"type":"auth_invalid","message":"Invalid access token or password"})");
    EXPECT_EQ(WsMessage::Type::AuthInvalid, invalid.type);
    EXPECT_EQ("Invalid access token or password", invalid.message);
}

TEST(WsMessagesTest, SuccessfulResult)
{
    WsMessage msg = decode(R"({"id":12,"type":"result","success":true,"result":[1,2]})");
    EXPECT_EQ(WsMessage::Type::Result, msg.type);
    EXPECT_EQ(12, msg.id);
    EXPECT_TRUE(msg.success);
    EXPECT_TRUE(cJSON_IsArray(cJSON_GetObjectItemCaseSensitive(msg.root.get(), "result")));
}

TEST(WsMessagesTest, FailedResultCarriesMessage)
{
    WsMessage msg = decode(R"({"id":3,"type":"result","success":false,"error":{"code":"not_found","message":"Entity not found"}})");
    EXPECT_EQ(WsMessage::Type::Result, msg.type);
    EXPECT_FALSE(msg.success);
    EXPECT_EQ("Entity not found", msg.message);
}

TEST(WsMessagesTest, ResultWithoutIdIsUnknown)
{
    EXPECT_EQ(WsMessage::Type::Unknown, decode(R"({"type":"result","success":true})").type);
}

TEST(WsMessagesTest, StateChangedEvent)
{
    WsMessage msg = decode(R"({"id":1,"type":"event","event":{"event_type":"state_changed","data":{
        "entity_id":"sensor.kitchen_illuminance",
        "new_state":{"entity_id":"sensor.kitchen_illuminance","state":"310","attributes":{"unit_of_measurement":"lx"},
                     "last_changed":"2024-06-01T10:00:01+00:00","last_updated":"2024-06-01T10:00:01+00:00"},
        "old_state":{"entity_id":"sensor.kitchen_illuminance","state":"305","attributes":{},
                     "last_changed":"2024-06-01T10:00:00+00:00","last_updated":"2024-06-01T10:00:00+00:00"}}}})");
    ASSERT_EQ(WsMessage::Type::Event, msg.type);
    EXPECT_EQ("state_changed", msg.event_type);
    EXPECT_EQ("sensor.kitchen_illuminance", msg.entity_id);
    ASSERT_TRUE(msg.new_state);
    ASSERT_TRUE(msg.old_state);
    EXPECT_EQ("310", msg.new_state->state);
    EXPECT_EQ("305", msg.old_state->state);
    EXPECT_STREQ("lx", json::get_string(msg.new_state->attributes.get(), "unit_of_measurement"));
}

TEST(WsMessagesTest, RemovedEntityHasNoNewState)
{
    WsMessage msg = decode(R"({"type":"event","event":{"event_type":"state_changed","data":{
        "entity_id":"sensor.gone","new_state":null,
        "old_state":{"entity_id":"sensor.gone","state":"1","attributes":{}}}}})");
    ASSERT_EQ(WsMessage::Type::Event, msg.type);
    EXPECT_FALSE(msg.new_state);
    EXPECT_TRUE(msg.old_state);
}

TEST(WsMessagesTest, UnknownAndMalformed)
{
    WsMessage pong = decode(R"({"id":4,"type":"pong"})");
    EXPECT_EQ(WsMessage::Type::Unknown, pong.type);
    EXPECT_EQ("pong", pong.type_name);

    EXPECT_EQ(WsMessage::Type::Unknown, decode(R"({"id":4})").type);
    EXPECT_EQ(WsMessage::Type::Malformed, decode("{\"type\":").type);
    EXPECT_EQ(WsMessage::Type::Malformed, decode("[]").type);
}

TEST(WsMessagesTest, AuthEncoding)
{
    json::Ptr auth = json::parse(transport::encode_auth("secret"));
    EXPECT_STREQ("auth", json::get_string(auth.get(), "type"));
    EXPECT_STREQ("secret", json::get_string(auth.get(), "access_token"));
    EXPECT_EQ(nullptr, cJSON_GetObjectItemCaseSensitive(auth.get(), "id"));
}

TEST(WsMessagesTest, CommandHasTypeOnly)
{
    json::Ptr cmd = transport::make_command("get_states");
    EXPECT_STREQ("get_states", json::get_string(cmd.get(), "type"));
    EXPECT_EQ(1, cJSON_GetArraySize(cmd.get()));
}
