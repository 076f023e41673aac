/*
 * File: src/relay_discovery.hpp
 * Project: ChartLink Relay
 * Purpose: UDP broadcast discovery of a charting tool on the local network
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Discovery: UDP token on 55555, JSON reply carrying ws_url
 *  - Only the first reply is consulted; later ones are dropped
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <array>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "relay_state.hpp"

namespace net = boost::asio;
using udp = net::ip::udp;

// -------- target set --------

// Global broadcast first, then the broadcast address of every up,
// non-loopback IPv4 interface that has one.
inline std::vector<std::string> broadcast_targets(const LogSink &log = {})
{
    std::vector<std::string> out{net::ip::address_v4::broadcast().to_string()};

    ifaddrs *list = nullptr;
    if (getifaddrs(&list) != 0)
    {
        if (log)
            log(std::string("Failed to enumerate network interfaces: ") + std::strerror(errno));
        return out;
    }
    for (auto *ifa = list; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
            continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK))
            continue;
        if (!(ifa->ifa_flags & IFF_BROADCAST) || ifa->ifa_broadaddr == nullptr)
            continue;
        auto *b = reinterpret_cast<sockaddr_in *>(ifa->ifa_broadaddr);
        char ip[INET_ADDRSTRLEN]{};
        if (inet_ntop(AF_INET, &b->sin_addr, ip, sizeof(ip)))
            out.emplace_back(ip);
    }
    freeifaddrs(list);
    return out;
}

// Drops repeated literal addresses, keeping first-seen order.
inline std::vector<std::string> dedupe_targets(const std::vector<std::string> &in)
{
    std::vector<std::string> out;
    for (const auto &t : in)
    {
        if (std::find(out.begin(), out.end(), t) == out.end())
            out.push_back(t);
    }
    return out;
}

inline bool is_blank(const std::string &s)
{
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

// -------- response --------

// Reply body: {"ws_url":..., "name"?, "version"?, "http_info_url"?}.
// Anything without a non-blank string ws_url is not a server.
inline std::optional<DiscoveredServer> parse_discovery_response(const std::string &text, const LogSink &log = {})
{
    auto j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        if (log)
            log("Discover response is not a JSON object");
        return std::nullopt;
    }
    auto str = [&](const char *key)
    {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };

    DiscoveredServer s;
    s.stream_url = str("ws_url");
    if (is_blank(s.stream_url))
        return std::nullopt;
    s.info_url = str("http_info_url");
    s.name = str("name");
    s.version = str("version");
    return s;
}

// -------- client --------

class DiscoveryClient
{
    std::string token_;
    std::vector<std::string> extra_targets_;
    LogSink log_;
    std::string bind_address_;

    void log(const std::string &line) const
    {
        if (log_)
            log_(line);
    }

public:
    DiscoveryClient(std::string token, std::vector<std::string> extra_targets, LogSink log,
                    std::string bind_address = "0.0.0.0")
        : token_(std::move(token)), extra_targets_(std::move(extra_targets)), log_(std::move(log)),
          bind_address_(std::move(bind_address)) {}

    // Blocks for at most `timeout`. Returns nullopt when nobody answers or the
    // first answer is unusable; throws boost::system::system_error when the
    // local socket cannot be set up.
    std::optional<DiscoveredServer> discover(uint16_t port, std::chrono::milliseconds timeout) const
    {
        log("Starting UDP discover: port=" + std::to_string(port) + ", timeout=" + std::to_string(timeout.count()) + "ms");

        auto candidates = broadcast_targets(log_);
        candidates.insert(candidates.end(), extra_targets_.begin(), extra_targets_.end());
        auto targets = dedupe_targets(candidates);
        {
            std::string joined;
            for (const auto &t : targets)
                joined += (joined.empty() ? "" : ", ") + t;
            log("Broadcast targets: " + joined);
        }

        net::io_context io;
        udp::socket socket(io);
        socket.open(udp::v4());
        socket.set_option(net::socket_base::broadcast(true));
        socket.bind(udp::endpoint(net::ip::make_address_v4(bind_address_), 0));

        // literals resolve without a lookup; host names go through the resolver
        udp::resolver resolver(io);
        for (const auto &t : targets)
        {
            const std::string where = t + ":" + std::to_string(port);
            log("Sending broadcast to " + where);
            boost::system::error_code ec;
            auto results = resolver.resolve(udp::v4(), t, std::to_string(port), ec);
            if (!ec && results.empty())
                ec = net::error::host_not_found;
            if (!ec)
                socket.send_to(net::buffer(token_), results.begin()->endpoint(), 0, ec);
            if (ec)
                log("Send failed to " + where + ": " + ec.message());
        }
        log("All broadcasts sent, waiting for response...");

        std::array<char, 2048> buf{};
        udp::endpoint sender;
        boost::system::error_code rx_ec;
        std::size_t rx_len = 0;
        bool done = false;
        socket.async_receive_from(net::buffer(buf), sender,
                                  [&](const boost::system::error_code &ec, std::size_t n)
                                  {
                                      done = true;
                                      rx_ec = ec;
                                      rx_len = n;
                                  });
        io.run_for(timeout);
        if (!done)
        {
            // drain the cancelled receive so the handler never outlives this frame
            boost::system::error_code ignored;
            socket.cancel(ignored);
            io.restart();
            io.run();
        }
        if (rx_ec == net::error::operation_aborted)
        {
            log("Timeout: no UDP response within " + std::to_string(timeout.count()) + "ms");
            return std::nullopt;
        }
        if (rx_ec)
        {
            log("Discover exception: " + std::string(rx_ec.category().name()) + ": " + rx_ec.message());
            return std::nullopt;
        }

        std::string text(buf.data(), rx_len);
        log("Received response from " + sender.address().to_string() + ": " + text);
        auto server = parse_discovery_response(text, log_);
        if (server && !server->name.empty())
            log("Server name=" + server->name + ", version=" + server->version);
        return server;
    }
};
