#pragma once
#include <chrono>
#include <stdexcept>
#include <string>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include "common/url.hpp"

// GET <http_info_url> and return the parsed body. Throws on transport
// failure, timeout, non-200 status or a body that is not JSON.
inline nlohmann::json fetch_server_info(const std::string &url, std::chrono::milliseconds timeout = std::chrono::seconds(3))
{
    namespace http = boost::beast::http;
    auto parts = parse_url(url);

    boost::asio::io_context ctx;
    boost::asio::ip::tcp::resolver resolver{ctx};
    boost::beast::tcp_stream stream{ctx};
    auto const results = resolver.resolve(parts.host, parts.port);

    http::request<http::string_body> req{http::verb::get, parts.target, 11};
    req.set(http::field::host, parts.host_header());
    req.set(http::field::accept, "application/json");

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    boost::beast::error_code result;

    // tcp_stream deadlines only apply to async operations
    stream.expires_after(timeout);
    stream.async_connect(results, [&](boost::beast::error_code ec, const boost::asio::ip::tcp::endpoint &)
                         {
        if (ec) { result = ec; return; }
        http::async_write(stream, req, [&](boost::beast::error_code ec, std::size_t)
                          {
            if (ec) { result = ec; return; }
            http::async_read(stream, buffer, res, [&](boost::beast::error_code ec, std::size_t)
                             { result = ec; }); }); });
    ctx.run();

    boost::system::error_code ignored;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

    if (result)
        throw boost::system::system_error(result, "info request to " + url);
    if (res.result() != http::status::ok)
        throw std::runtime_error("info request failed: status=" + std::to_string(res.result_int()));
    auto j = nlohmann::json::parse(res.body(), nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("info response is not JSON");
    return j;
}
