/*
 * File: src/relay_state.hpp
 * Project: ChartLink Relay
 * Purpose: Relay configuration, discovery record and connect results
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Discovery: UDP token on 55555, JSON reply carrying ws_url
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>


using LogSink = std::function<void(const std::string &)>;


struct RelayConfig {
uint16_t discovery_port = 55555;
std::chrono::milliseconds discovery_timeout{1000};
std::string discovery_token{"RotaenoChartTool_DISCOVER_V1"};
std::vector<std::string> extra_targets; // unicast hosts or IPv4 literals probed alongside the broadcasts
std::string discovery_bind_address{"0.0.0.0"}; // local IPv4 the discovery socket binds to
std::string close_reason{"Client closing"};
};


struct DiscoveredServer {
std::string stream_url;
std::string info_url;
std::string name;
std::string version;
};


struct ConnectResult
{
    enum class Kind
    {
        ok,
        not_found,
        error
    };

    Kind kind = Kind::not_found;
    std::string payload; // url for ok, message for error

    static ConnectResult ok(std::string url = {}) { return {Kind::ok, std::move(url)}; }
    static ConnectResult not_found() { return {Kind::not_found, {}}; }
    static ConnectResult error(std::string message) { return {Kind::error, std::move(message)}; }

    // "ok" / "ok:<url>" / "not_found" / "error:<message>"
    std::string to_string() const
    {
        switch (kind)
        {
        case Kind::ok:
            return payload.empty() ? std::string("ok") : "ok:" + payload;
        case Kind::not_found:
            return "not_found";
        case Kind::error:
            return "error:" + payload;
        }
        return "not_found";
    }
};
