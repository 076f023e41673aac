/*
 * File: src/relay_main.cpp
 * Project: ChartLink Relay
 * Purpose: Relay binary: discover a charting tool, hold the stream, poll frames
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Discovery: UDP token on 55555, JSON reply carrying ws_url
 *  - Polls the snapshot on a fixed tick, like a render loop would
 * Last updated: 2026-10-18
 */

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/frame.hpp"
#include "common/url.hpp"
#include "relay_discovery.hpp"
#include "relay_info.hpp"
#include "relay_manager.hpp"
#include "relay_state.hpp"

// --probe: discovery only, print what answered
static int probe(const RelayConfig &cfg)
{
    DiscoveryClient client(cfg.discovery_token, cfg.extra_targets, [](const std::string &line)
                           { std::cerr << "[discovery] " << line << "\n"; },
                           cfg.discovery_bind_address);
    auto server = client.discover(cfg.discovery_port, cfg.discovery_timeout);
    if (!server)
    {
        std::cout << "not_found\n";
        return 2;
    }
    nlohmann::json j{{"ws_url", server->stream_url}, {"name", server->name}, {"version", server->version}, {"http_info_url", server->info_url}};
    std::cout << j.dump(2) << std::endl;
    if (!server->info_url.empty())
    {
        try
        {
            std::cout << fetch_server_info(server->info_url).dump(2) << std::endl;
        }
        catch (const std::exception &e)
        {
            std::cerr << "WARN: info fetch failed: " << e.what() << "\n";
        }
    }
    return 0;
}

int main(int argc, char **argv)
{
    RelayConfig cfg;
    std::string manual_url;
    int poll_ms = 500;
    int ticks = 0; // 0 = until the stream ends
    bool probe_only = false;
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--port" && i + 1 < argc)
                cfg.discovery_port = parse_port(argv[++i]);
            else if (a == "--timeout-ms" && i + 1 < argc)
                cfg.discovery_timeout = std::chrono::milliseconds(std::stoi(argv[++i]));
            else if (a == "--token" && i + 1 < argc)
                cfg.discovery_token = argv[++i];
            else if (a == "--bind" && i + 1 < argc)
                cfg.discovery_bind_address = argv[++i];
            else if (a == "--target" && i + 1 < argc)
                cfg.extra_targets.push_back(argv[++i]);
            else if (a == "--url" && i + 1 < argc)
                manual_url = argv[++i];
            else if (a == "--poll-ms" && i + 1 < argc)
                poll_ms = std::max(1, std::stoi(argv[++i]));
            else if (a == "--ticks" && i + 1 < argc)
                ticks = std::stoi(argv[++i]);
            else if (a == "--probe")
                probe_only = true;
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "chartlink: bad argument: " << e.what() << "\n";
        return 64;
    }

    if (probe_only)
    {
        try
        {
            return probe(cfg);
        }
        catch (const std::exception &e)
        {
            std::cerr << "chartlink probe error: " << e.what() << "\n";
            return 1;
        }
    }

    ConnectionManager relay{cfg};
    auto result = manual_url.empty() ? relay.discover_and_connect() : relay.connect_with_url(manual_url);
    std::cout << "[relay] " << result.to_string() << "\n";
    if (result.kind != ConnectResult::Kind::ok)
    {
        std::cerr << relay.discover_debug_log() << "\n";
        return result.kind == ConnectResult::Kind::not_found ? 2 : 1;
    }

    std::string last_frame;
    std::string last_state;
    for (int n = 0; ticks == 0 || n < ticks; ++n)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));

        auto state = relay.connection_state();
        if (state != last_state)
        {
            std::cout << "[relay] state=" << state << "\n";
            last_state = state;
        }
        auto frame = relay.latest_frame_json();
        if (!frame.empty() && frame != last_frame)
        {
            std::cout << "[relay] " << summarize_frame(frame) << "\n";
            last_frame = std::move(frame);
        }

        if (state == "error")
        {
            std::cerr << "[relay] last error: " << relay.last_error() << "\n";
            std::cerr << relay.discover_debug_log() << "\n";
            return 1;
        }
        if (state == "disconnected")
            break;
    }
    relay.disconnect();
    return 0;
}
