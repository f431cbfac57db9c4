#include <gtest/gtest.h>

#include "fakes/fake_read_transport.hpp"
#include "live/status_report.hpp"

TEST(StatusReportTest, ReportsBothBackends)
{
    fakes::FakeReadTransport read;
    transport::TransportStatus status;
    status.active = transport::Kind::WebSocket;
    status.ws_available = true;
    status.rest_available = false;

    json::Ptr report = live::build_status_json(read, status);
    EXPECT_STREQ("websocket", json::get_string(report.get(), "readTransport"));
    EXPECT_STREQ("rest", json::get_string(report.get(), "writeTransport"));
    EXPECT_TRUE(json::get_bool(report.get(), "wsAvailable", false));
    EXPECT_FALSE(json::get_bool(report.get(), "restAvailable", true));
    EXPECT_TRUE(json::get_bool(report.get(), "connected", false));
}

TEST(StatusReportTest, RestFallback)
{
    fakes::FakeReadTransport read;
    read.kind_value = transport::Kind::Rest;
    read.connected = false;
    transport::TransportStatus status;
    status.rest_available = true;

    json::Ptr report = live::build_status_json(read, status);
    EXPECT_STREQ("rest", json::get_string(report.get(), "readTransport"));
    EXPECT_FALSE(json::get_bool(report.get(), "wsAvailable", true));
    EXPECT_FALSE(json::get_bool(report.get(), "connected", true));
}
