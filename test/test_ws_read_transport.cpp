#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "core/hub_err.h"
#include "fakes/fake_ws_link.hpp"
#include "fakes/manual_scheduler.hpp"
#include "infra/transport/ws_read_transport.hpp"

using transport::WsReadTransport;

namespace
{

    const char *kStates = R"([
        {"entity_id":"sensor.a","state":"1","attributes":{"unit":"cm"},"last_changed":"t1","last_updated":"t1"},
        {"entity_id":"sensor.b","state":"2","attributes":{},"last_changed":"t1","last_updated":"t1"},
        {"entity_id":"binary_sensor.c","state":"on","attributes":{},"last_changed":"t1","last_updated":"t1"}
    ])";

    int command_id(const cJSON *command)
    {
        int id = -1;
        json::get_int(command, "id", id);
        return id;
    }

    class WsReadTransportTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            auto link = std::unique_ptr<fakes::FakeWsLink>(new fakes::FakeWsLink());
            link_ = link.get();
            link_->responder = [this](fakes::FakeWsLink &l, const cJSON *cmd)
            {
                const std::string type = json::get_string(cmd, "type", "");
                if (type == "subscribe_events")
                    l.push_result(command_id(cmd), "null");
                else if (type == "get_states" && answer_states_)
                    l.push_result(command_id(cmd), kStates);
            };

            WsReadTransport::Options options;
            options.url = "ws://ha.local:8123/api/websocket";
            options.access_token = "token";
            options.handshake_timeout_ms = 500;
            options.request_timeout_ms = 1000;
            options.reconnect_delay_ms = 5000;
            options.request_sweep_ms = 250;
            ws_.reset(new WsReadTransport(options, std::move(link), sched_));
        }

        void TearDown() override
        {
            ws_.reset();
        }

        fakes::ManualScheduler sched_;
        fakes::FakeWsLink *link_ = nullptr;
        std::unique_ptr<WsReadTransport> ws_;
        bool answer_states_ = true;
    };

} // namespace

TEST_F(WsReadTransportTest, HandshakeReachesReady)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    EXPECT_TRUE(ws_->is_connected());
    EXPECT_EQ(WsReadTransport::State::Ready, ws_->state());

    const std::vector<std::string> sent = link_->sent();
    ASSERT_FALSE(sent.empty());
    json::Ptr auth = json::parse(sent.front());
    EXPECT_STREQ("auth", json::get_string(auth.get(), "type"));
    EXPECT_STREQ("token", json::get_string(auth.get(), "access_token"));
}

TEST_F(WsReadTransportTest, RejectedTokenFailsAndNeverRetries)
{
    link_->accept_auth = false;
    EXPECT_EQ(HUB_ERR_AUTH, ws_->connect());
    EXPECT_FALSE(ws_->is_connected());

    sched_.advance(0);
    sched_.advance(60000);
    EXPECT_EQ(1, link_->open_count());
    EXPECT_FALSE(sched_.is_active("ws_reconnect"));
    EXPECT_EQ(HUB_ERR_AUTH, ws_->wait_until_ready());
}

TEST_F(WsReadTransportTest, SilentServerTimesOut)
{
    link_->server_speaks = false;
    EXPECT_EQ(ESP_ERR_TIMEOUT, ws_->connect_within(50));
    EXPECT_FALSE(ws_->is_connected());
}

TEST_F(WsReadTransportTest, OpenFailureReportsConnectionError)
{
    link_->fail_open = true;
    EXPECT_EQ(HUB_ERR_CONNECTION, ws_->connect());
    EXPECT_TRUE(sched_.is_active("ws_reconnect"));
}

TEST_F(WsReadTransportTest, ConcurrentCallsResolvedOutOfOrder)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = nullptr;
    const size_t base = link_->sent().size();

    json::Ptr devices;
    json::Ptr areas;
    esp_err_t devices_err = ESP_FAIL;
    esp_err_t areas_err = ESP_FAIL;
    std::thread first([&]()
                      { devices_err = ws_->list_devices(devices); });
    ASSERT_TRUE(link_->wait_for_sent(base + 1, std::chrono::seconds(2)));
    std::thread second([&]()
                       { areas_err = ws_->list_area_registry(areas); });
    ASSERT_TRUE(link_->wait_for_sent(base + 2, std::chrono::seconds(2)));

    auto device_cmds = link_->commands("config/device_registry/list");
    auto area_cmds = link_->commands("config/area_registry/list");
    ASSERT_EQ(1u, device_cmds.size());
    ASSERT_EQ(1u, area_cmds.size());
    const int device_id = command_id(device_cmds[0].get());
    const int area_id = command_id(area_cmds[0].get());
    EXPECT_LT(device_id, area_id);

    link_->push_result(area_id, R"([{"area_id":"kitchen","name":"Kitchen"}])");
    link_->push_result(device_id, R"([{"id":"dev1"},{"id":"dev2"}])");
    first.join();
    second.join();

    ASSERT_EQ(ESP_OK, devices_err);
    ASSERT_EQ(ESP_OK, areas_err);
    EXPECT_EQ(2, cJSON_GetArraySize(devices.get()));
    ASSERT_EQ(1, cJSON_GetArraySize(areas.get()));
    EXPECT_STREQ("kitchen", json::get_string(cJSON_GetArrayItem(areas.get(), 0), "area_id"));
}

TEST_F(WsReadTransportTest, IdsIncreaseAcrossCommands)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    ha::StatePtr a;
    ASSERT_EQ(ESP_OK, ws_->get_state("sensor.a", a));
    ha::StatePtr b;
    ASSERT_EQ(ESP_OK, ws_->get_state("sensor.b", b));

    auto cmds = link_->commands("get_states");
    ASSERT_EQ(2u, cmds.size());
    EXPECT_EQ(1, command_id(cmds[0].get()));
    EXPECT_EQ(2, command_id(cmds[1].get()));
}

TEST_F(WsReadTransportTest, RejectedCommandReportsCommandFailed)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = [](fakes::FakeWsLink &l, const cJSON *cmd)
    { l.push_result(command_id(cmd), "", false); };

    json::Ptr out;
    EXPECT_EQ(HUB_ERR_COMMAND_FAILED, ws_->list_entity_registry(out));
}

TEST_F(WsReadTransportTest, UnansweredRequestTimesOut)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = nullptr;

    std::atomic<int> calls{0};
    esp_err_t result = ESP_OK;
    int id = ws_->call_async(transport::make_command("get_services"), [&](esp_err_t err, json::Ptr resp)
                             {
                                 ++calls;
                                 result = err;
                                 EXPECT_EQ(nullptr, resp.get()); });
    ASSERT_GT(id, 0);

    sched_.advance(750);
    EXPECT_EQ(0, calls.load());
    sched_.advance(500);
    EXPECT_EQ(1, calls.load());
    EXPECT_EQ(HUB_ERR_REQUEST_TIMEOUT, result);

    // A late answer is ignored.
    link_->push_result(id, "{}");
    EXPECT_EQ(1, calls.load());
    EXPECT_TRUE(ws_->is_connected());
}

TEST_F(WsReadTransportTest, CallAsyncWhileDisconnectedFailsImmediately)
{
    esp_err_t result = ESP_OK;
    EXPECT_EQ(0, ws_->call_async(transport::make_command("get_states"), [&](esp_err_t err, json::Ptr)
                                 { result = err; }));
    EXPECT_EQ(HUB_ERR_CONNECTION, result);
}

TEST_F(WsReadTransportTest, DropFailsPendingRequests)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = nullptr;

    std::vector<esp_err_t> results;
    ws_->call_async(transport::make_command("get_states"), [&](esp_err_t err, json::Ptr)
                    { results.push_back(err); });
    ws_->call_async(transport::make_command("get_services"), [&](esp_err_t err, json::Ptr)
                    { results.push_back(err); });

    link_->drop();
    ASSERT_EQ(2u, results.size());
    EXPECT_EQ(HUB_ERR_CONNECTION_CLOSED, results[0]);
    EXPECT_EQ(HUB_ERR_CONNECTION_CLOSED, results[1]);
    EXPECT_FALSE(ws_->is_connected());
}

TEST_F(WsReadTransportTest, StateChangesReachMatchingSubscribers)
{
    ASSERT_EQ(ESP_OK, ws_->connect());

    std::vector<std::string> seen;
    ws_->subscribe_to_state_changes({"sensor.a"}, [&](const std::string &id, const ha::StatePtr &now, const ha::StatePtr &)
                                    { seen.push_back(id + "=" + now->state); });
    EXPECT_TRUE(ws_->is_upstream_subscribed());

    for (int i = 0; i < 5; ++i)
        link_->push_state_changed("sensor.a", std::to_string(i), i ? std::to_string(i - 1) : "");
    link_->push_state_changed("sensor.b", "9", "8");

    ASSERT_EQ(5u, seen.size());
    EXPECT_EQ("sensor.a=0", seen.front());
    EXPECT_EQ("sensor.a=4", seen.back());
}

TEST_F(WsReadTransportTest, SingleUpstreamSubscriptionForManyLocalOnes)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    int all = 0;
    int only_b = 0;
    ws_->subscribe_to_state_changes({}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { ++all; });
    ws_->subscribe_to_state_changes({"sensor.b"}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { ++only_b; });

    EXPECT_EQ(1u, link_->commands("subscribe_events").size());
    link_->push_state_changed("sensor.a", "1", "0");
    link_->push_state_changed("sensor.b", "1", "0");
    EXPECT_EQ(2, all);
    EXPECT_EQ(1, only_b);
}

TEST_F(WsReadTransportTest, ThrowingCallbackDoesNotStopOthers)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    int delivered = 0;
    ws_->subscribe_to_state_changes({"sensor.a"}, [](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { throw std::runtime_error("boom"); });
    ws_->subscribe_to_state_changes({"sensor.a"}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { ++delivered; });

    link_->push_state_changed("sensor.a", "1", "0");
    link_->push_state_changed("sensor.a", "2", "1");
    EXPECT_EQ(2, delivered);
    EXPECT_TRUE(ws_->is_connected());
}

TEST_F(WsReadTransportTest, NonStandardThrowDoesNotStopOthers)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    int delivered = 0;
    ws_->subscribe_to_state_changes({"sensor.a"}, [](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { throw 42; });
    ws_->subscribe_to_state_changes({"sensor.a"}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { ++delivered; });

    EXPECT_NO_THROW(link_->push_state_changed("sensor.a", "1", "0"));
    EXPECT_NO_THROW(link_->push_state_changed("sensor.a", "2", "1"));
    EXPECT_EQ(2, delivered);
    EXPECT_TRUE(ws_->is_connected());
}

TEST_F(WsReadTransportTest, UnsubscribeStopsDelivery)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    int delivered = 0;
    auto id = ws_->subscribe_to_state_changes({"sensor.a"}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                              { ++delivered; });
    link_->push_state_changed("sensor.a", "1", "0");
    ws_->unsubscribe(id);
    link_->push_state_changed("sensor.a", "2", "1");
    EXPECT_EQ(1, delivered);
}

TEST_F(WsReadTransportTest, ReconnectRestoresSubscriptions)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    int delivered = 0;
    ws_->subscribe_to_state_changes({"sensor.a"}, [&](const std::string &, const ha::StatePtr &, const ha::StatePtr &)
                                    { ++delivered; });

    link_->drop();
    EXPECT_FALSE(ws_->is_connected());
    EXPECT_FALSE(ws_->is_upstream_subscribed());
    EXPECT_TRUE(sched_.is_active("ws_reconnect"));

    sched_.advance(4999);
    EXPECT_EQ(1, link_->open_count());
    sched_.advance(1);
    EXPECT_EQ(2, link_->open_count());
    ASSERT_TRUE(ws_->is_connected());

    auto subs = link_->commands("subscribe_events");
    ASSERT_EQ(2u, subs.size());
    // Ids restart on the new channel.
    EXPECT_EQ(1, command_id(subs[1].get()));
    EXPECT_TRUE(ws_->is_upstream_subscribed());

    link_->push_state_changed("sensor.a", "1", "0");
    EXPECT_EQ(1, delivered);
}

TEST_F(WsReadTransportTest, CallWaitsForReconnect)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->drop();
    ASSERT_FALSE(ws_->is_connected());
    const size_t base = link_->sent().size();

    json::Ptr devices;
    esp_err_t err = ESP_FAIL;
    std::thread caller([&]()
                       { err = ws_->list_devices(devices); });

    // Nothing goes out while the channel is down.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(base, link_->sent().size());

    sched_.advance(5000);
    ASSERT_TRUE(ws_->is_connected());
    // auth, then the waiting command
    ASSERT_TRUE(link_->wait_for_sent(base + 2, std::chrono::seconds(2)));
    auto cmds = link_->commands("config/device_registry/list");
    ASSERT_EQ(1u, cmds.size());
    link_->push_result(command_id(cmds[0].get()), R"([{"id":"dev1"}])");
    caller.join();

    ASSERT_EQ(ESP_OK, err);
    EXPECT_EQ(1, cJSON_GetArraySize(devices.get()));
}

TEST_F(WsReadTransportTest, CallTimesOutWhenNeverReady)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->drop();
    const size_t base = link_->sent().size();

    json::Ptr devices;
    EXPECT_EQ(HUB_ERR_REQUEST_TIMEOUT, ws_->list_devices(devices));
    EXPECT_EQ(base, link_->sent().size());
}

TEST_F(WsReadTransportTest, DisconnectCancelsReconnect)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->drop();
    ws_->disconnect();
    sched_.advance(60000);
    EXPECT_EQ(1, link_->open_count());
}

TEST_F(WsReadTransportTest, BulkFetchReturnsExistingSubset)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    ha::StateMap states;
    ASSERT_EQ(ESP_OK, ws_->get_states({"sensor.a", "binary_sensor.c", "sensor.missing"}, states));
    ASSERT_EQ(2u, states.size());
    EXPECT_EQ("1", states["sensor.a"]->state);
    EXPECT_EQ("on", states["binary_sensor.c"]->state);
    EXPECT_EQ(0u, states.count("sensor.missing"));
    EXPECT_STREQ("cm", json::get_string(states["sensor.a"]->attributes.get(), "unit"));
}

TEST_F(WsReadTransportTest, EmptyBulkFetchSendsNothing)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    ha::StateMap states;
    EXPECT_EQ(ESP_OK, ws_->get_states({}, states));
    EXPECT_TRUE(states.empty());
    EXPECT_TRUE(link_->commands("get_states").empty());
}

TEST_F(WsReadTransportTest, MissingEntityIsNotFound)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    ha::StatePtr out;
    EXPECT_EQ(ESP_ERR_NOT_FOUND, ws_->get_state("sensor.nope", out));
}

TEST_F(WsReadTransportTest, ServicesByDomainAreSorted)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = [](fakes::FakeWsLink &l, const cJSON *cmd)
    {
        l.push_result(command_id(cmd),
                      R"({"light":{"turn_on":{},"toggle":{},"turn_off":{}},"switch":{"turn_on":{}}})");
    };
    std::vector<std::string> services;
    ASSERT_EQ(ESP_OK, ws_->get_services_by_domain("light", services));
    ASSERT_EQ(3u, services.size());
    EXPECT_EQ("light.toggle", services[0]);
    EXPECT_EQ("light.turn_off", services[1]);
    EXPECT_EQ("light.turn_on", services[2]);
}

TEST_F(WsReadTransportTest, ServicesForTargetCarriesTarget)
{
    ASSERT_EQ(ESP_OK, ws_->connect());
    link_->responder = [](fakes::FakeWsLink &l, const cJSON *cmd)
    { l.push_result(command_id(cmd), R"(["light.turn_on"])"); };

    json::Ptr target = json::parse(R"({"entity_id":["light.desk"]})");
    json::Ptr out;
    ASSERT_EQ(ESP_OK, ws_->get_services_for_target(target.get(), true, out));
    EXPECT_EQ(1, cJSON_GetArraySize(out.get()));

    auto cmds = link_->commands("get_services_for_target");
    ASSERT_EQ(1u, cmds.size());
    EXPECT_TRUE(json::get_bool(cmds[0].get(), "expand_group", false));
    EXPECT_NE(nullptr, cJSON_GetObjectItemCaseSensitive(cmds[0].get(), "target"));
}
