#include <algorithm>
#include <cmath>
#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "common/frame.hpp"
#include "common/url.hpp"
#include "tool_discovery.hpp"
#include "tool_http.hpp"
#include "tool_state.hpp"
#include "tool_ws.hpp"

// Synthetic chart: a ring of notes scrolling past the judgement line.
static Frame make_demo_frame(double t)
{
    Frame f;
    f.timestamp = t;
    f.start_chart_time = t;
    f.start_distance = t * 4.0;
    f.cur_degree = std::fmod(t * 45.0, 360.0);
    f.speed = 1.0;
    for (int i = 0; i < 8; ++i)
    {
        Note n;
        n.id = static_cast<int64_t>(std::floor(t)) * 8 + i;
        n.note_type = i % 3;
        n.kind = (n.note_type == 0) ? "tap" : (n.note_type == 1) ? "slide" : "flick";
        n.time = std::floor(t) + i * 0.25;
        n.distance = (n.time - t) * 4.0;
        n.degree = std::fmod(i * 45.0, 360.0);
        n.delta = (n.kind == "slide") ? 30.0 : 0.0;
        n.radius_multiplier = 1.0;
        n.base = {{"time", n.time}, {"degree", n.degree}, {"width", 20.0}};
        if (n.kind == "slide")
            n.base["end_degree"] = n.degree + n.delta;
        f.notes.push_back(std::move(n));
    }
    return f;
}

int main(int argc, char **argv)
{
    ToolConfig cfg;
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--discovery-port" && i + 1 < argc)
                cfg.discovery_port = parse_port(argv[++i], true);
            else if (a == "--ws" && i + 1 < argc)
                cfg.ws_port = parse_port(argv[++i], true);
            else if (a == "--http" && i + 1 < argc)
                cfg.http_port = parse_port(argv[++i], true);
            else if (a == "--host" && i + 1 < argc)
                cfg.advertise_host = argv[++i];
            else if (a == "--name" && i + 1 < argc)
                cfg.name = argv[++i];
            else if (a == "--version" && i + 1 < argc)
                cfg.version = argv[++i];
            else if (a == "--fps" && i + 1 < argc)
                cfg.fps = std::max(1, std::stoi(argv[++i]));
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "tool_emulator: bad argument: " << e.what() << "\n";
        return 2;
    }

    try
    {
        boost::asio::io_context ioc{1};
        ToolState state;
        state.config = cfg;

        auto bind_addr = boost::asio::ip::make_address(cfg.bind_host);
        FrameServer ws{ioc, {bind_addr, cfg.ws_port}, state};
        InfoServer http{ioc, {bind_addr, cfg.http_port}, state};
        state.ws_port = ws.port();
        state.http_port = http.port();
        DiscoveryResponder discovery{ioc, {bind_addr, cfg.discovery_port}, cfg.token, [&state]
                                     { return state.discovery_reply(); }};

        boost::asio::steady_timer tick{ioc};
        const auto period = std::chrono::milliseconds(1000 / cfg.fps);
        std::function<void()> schedule = [&]
        {
            tick.expires_after(period);
            tick.async_wait([&](boost::system::error_code ec)
                            {
                if (ec)
                    return;
                auto t = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                ws.broadcast(frame_to_json(make_demo_frame(t)).dump());
                schedule(); });
        };
        schedule();

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](boost::system::error_code, int)
                           {
            std::cout << "tool shutting down\n";
            tick.cancel();
            discovery.stop();
            http.stop();
            ws.stop(); });

        std::cout << "tool listening discovery=" << discovery.port() << " ws=" << state.ws_url()
                  << " http=" << state.info_url() << " fps=" << cfg.fps << "\n";
        ioc.run();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "tool_emulator error: " << e.what() << "\n";
        return 1;
    }
}
