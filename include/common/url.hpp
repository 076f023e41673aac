/*
 * File: include/common/url.hpp
 * Project: ChartLink Relay
 * Purpose: Split ws:// and http:// URLs into host, port and target
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - No TLS: wss:// and https:// are rejected
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>

struct UrlParts
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string target{"/"};

    // Host header value; the port is omitted when it is the default.
    std::string host_header() const
    {
        bool v6 = host.find(':') != std::string::npos;
        std::string h = v6 ? "[" + host + "]" : host;
        return port == "80" ? h : h + ":" + port;
    }
};

// Decimal port, 1..65535 (0 as well when allow_zero, for ephemeral binds).
inline uint16_t parse_port(const std::string &text, bool allow_zero = false)
{
    bool digits = !text.empty() && text.size() <= 5 &&
                  std::all_of(text.begin(), text.end(), [](unsigned char c)
                              { return std::isdigit(c) != 0; });
    if (!digits)
        throw std::invalid_argument("bad port: " + text);
    auto value = std::stoul(text);
    if (value > 65535 || (value == 0 && !allow_zero))
        throw std::invalid_argument("bad port: " + text);
    return static_cast<uint16_t>(value);
}

// expect ws://host[:port][/path], http:// is accepted the same way
inline UrlParts parse_url(const std::string &url)
{
    UrlParts out;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw std::invalid_argument("missing scheme in url: " + url);
    out.scheme = url.substr(0, scheme_pos);
    std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    if (out.scheme == "wss" || out.scheme == "https")
        throw std::invalid_argument("secure scheme not supported: " + out.scheme);
    if (out.scheme != "ws" && out.scheme != "http")
        throw std::invalid_argument("unsupported scheme: " + out.scheme);

    auto rest = url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    if (slash != std::string::npos)
        out.target = rest.substr(slash);

    std::string port;
    if (!hp.empty() && hp.front() == '[')
    {
        auto close = hp.find(']');
        if (close == std::string::npos)
            throw std::invalid_argument("unterminated IPv6 literal in url: " + url);
        out.host = hp.substr(1, close - 1);
        if (close + 1 < hp.size())
        {
            if (hp[close + 1] != ':')
                throw std::invalid_argument("bad authority in url: " + url);
            port = hp.substr(close + 2);
        }
    }
    else
    {
        auto colon = hp.find(':');
        out.host = hp.substr(0, colon);
        if (colon != std::string::npos)
            port = hp.substr(colon + 1);
    }

    if (out.host.empty())
        throw std::invalid_argument("missing host in url: " + url);

    if (port.empty())
    {
        out.port = "80";
    }
    else
    {
        try
        {
            out.port = std::to_string(parse_port(port));
        }
        catch (const std::invalid_argument &)
        {
            throw std::invalid_argument("bad port in url: " + url);
        }
    }
    return out;
}
