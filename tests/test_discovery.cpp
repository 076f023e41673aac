/*
 * File: tests/test_discovery.cpp
 * Project: ChartLink Relay
 * Purpose: UDP discovery client against a loopback responder
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Discovery: UDP token on 55555, JSON reply carrying ws_url
 * Last updated: 2026-10-18
 */

#include <catch2/catch.hpp>
#include <array>
#include <chrono>
#include <string>
#include <thread>
#include "relay_discovery.hpp"
#include "tool_harness.hpp"

using namespace std::chrono_literals;

TEST_CASE("response parsing")
{
    SECTION("full record")
    {
        auto s = parse_discovery_response(R"({"ws_url":"ws://10.0.0.5:8080/ws","name":"Tool","version":"1.2","http_info_url":"http://10.0.0.5:8081/info"})");
        REQUIRE(s);
        REQUIRE(s->stream_url == "ws://10.0.0.5:8080/ws");
        REQUIRE(s->name == "Tool");
        REQUIRE(s->version == "1.2");
        REQUIRE(s->info_url == "http://10.0.0.5:8081/info");
    }
    SECTION("optional fields may be absent")
    {
        auto s = parse_discovery_response(R"({"ws_url":"ws://h/ws"})");
        REQUIRE(s);
        REQUIRE(s->name.empty());
        REQUIRE(s->info_url.empty());
    }
    SECTION("missing or blank ws_url is not a server")
    {
        REQUIRE_FALSE(parse_discovery_response(R"({"ws_url":""})"));
        REQUIRE_FALSE(parse_discovery_response(R"({"ws_url":"   "})"));
        REQUIRE_FALSE(parse_discovery_response(R"({"name":"Tool","version":"1.2"})"));
        REQUIRE_FALSE(parse_discovery_response(R"({"ws_url":42})"));
    }
    SECTION("malformed json is not a server")
    {
        std::string logged;
        REQUIRE_FALSE(parse_discovery_response("{ws_url: nope", [&](const std::string &l)
                                               { logged += l; }));
        REQUIRE_FALSE(logged.empty());
        REQUIRE_FALSE(parse_discovery_response(R"(["ws://h/ws"])"));
    }
}

TEST_CASE("broadcast targets")
{
    auto targets = broadcast_targets();
    REQUIRE_FALSE(targets.empty());
    REQUIRE(targets.front() == "255.255.255.255");
    for (const auto &t : targets)
        REQUIRE(t != "127.255.255.255");

    auto d = dedupe_targets({"255.255.255.255", "192.168.1.255", "255.255.255.255", "10.0.0.255", "192.168.1.255"});
    REQUIRE(d == std::vector<std::string>{"255.255.255.255", "192.168.1.255", "10.0.0.255"});
}

TEST_CASE("discover finds the loopback tool")
{
    ToolHarness tool;
    std::string log;
    DiscoveryClient client(tool.state.config.token, {"127.0.0.1"}, [&](const std::string &l)
                           { log += l + "\n"; });
    auto s = client.discover(tool.discovery.port(), 2000ms);
    REQUIRE(s);
    REQUIRE(s->stream_url == tool.state.ws_url());
    REQUIRE(s->info_url == tool.state.info_url());
    REQUIRE(s->name == tool.state.config.name);
    REQUIRE(log.find("Sending broadcast to 127.0.0.1:" + std::to_string(tool.discovery.port())) != std::string::npos);
    REQUIRE(log.find("Received response from 127.0.0.1") != std::string::npos);
}

TEST_CASE("host name targets are resolved")
{
    ToolHarness tool;
    std::string log;
    DiscoveryClient client(tool.state.config.token, {"localhost"}, [&](const std::string &l)
                           { log += l + "\n"; });
    auto s = client.discover(tool.discovery.port(), 2000ms);
    REQUIRE(s);
    REQUIRE(s->stream_url == tool.state.ws_url());
    REQUIRE(log.find("Sending broadcast to localhost:") != std::string::npos);
    REQUIRE(log.find("Send failed to localhost") == std::string::npos);
}

TEST_CASE("unusable bind address is a local fault")
{
    DiscoveryClient client("RotaenoChartTool_DISCOVER_V1", {"127.0.0.1"}, {}, "192.0.2.1");
    REQUIRE_THROWS_AS(client.discover(55555, 200ms), boost::system::system_error);
    DiscoveryClient garbled("RotaenoChartTool_DISCOVER_V1", {}, {}, "not-an-address");
    REQUIRE_THROWS_AS(garbled.discover(55555, 200ms), boost::system::system_error);
}

TEST_CASE("wrong token gets no answer")
{
    ToolHarness tool;
    DiscoveryClient client("SomeOtherTool_DISCOVER", {"127.0.0.1"}, {});
    REQUIRE_FALSE(client.discover(tool.discovery.port(), 300ms));
}

TEST_CASE("silence until the timeout is not found")
{
    boost::asio::io_context io;
    udp::socket silent(io, udp::endpoint(loopback(), 0));
    std::string log;
    DiscoveryClient client("RotaenoChartTool_DISCOVER_V1", {"127.0.0.1"}, [&](const std::string &l)
                           { log += l + "\n"; });

    auto t0 = std::chrono::steady_clock::now();
    auto s = client.discover(silent.local_endpoint().port(), 200ms);
    REQUIRE_FALSE(s);
    REQUIRE(std::chrono::steady_clock::now() - t0 >= 200ms);
    REQUIRE(log.find("Timeout: no UDP response within 200ms") != std::string::npos);
}

TEST_CASE("malformed reply is not found")
{
    ToolHarness tool{std::string("definitely not json")};
    DiscoveryClient client(tool.state.config.token, {"127.0.0.1"}, {});
    REQUIRE_FALSE(client.discover(tool.discovery.port(), 1000ms));
}

TEST_CASE("first reply wins")
{
    boost::asio::io_context io;
    udp::socket responder(io, udp::endpoint(loopback(), 0));
    std::thread t([&]
                  {
        std::array<char, 256> buf{};
        udp::endpoint from;
        responder.receive_from(boost::asio::buffer(buf), from);
        responder.send_to(boost::asio::buffer(std::string(R"({"ws_url":"ws://first.local/ws"})")), from);
        responder.send_to(boost::asio::buffer(std::string(R"({"ws_url":"ws://second.local/ws"})")), from); });

    DiscoveryClient client("RotaenoChartTool_DISCOVER_V1", {"127.0.0.1"}, {});
    auto s = client.discover(responder.local_endpoint().port(), 2000ms);
    t.join();
    REQUIRE(s);
    REQUIRE(s->stream_url == "ws://first.local/ws");
}
