/*
 * File: src/tool_http.hpp
 * Project: ChartLink Relay
 * Purpose: HTTP info endpoint of the charting tool emulator
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - /health returns constant JSON plus uptime
 *  - WebSocket upgrades are not served here; they get the 404 fallback
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

#include "tool_state.hpp"

namespace http = boost::beast::http;

class InfoServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    ToolState &state_;

public:
    InfoServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ToolState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket_), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        ToolState &state;

        Session(boost::asio::ip::tcp::socket &&s, ToolState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "charttool-emulator");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void respond_json(http::status status, const nlohmann::json &body)
        {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            respond(std::move(res));
        }

        void handle()
        {
            using nlohmann::json;

            // GET /health
            if (req.method() == http::verb::get && req.target() == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return respond_json(http::status::ok, json{{"status", "ok"}, {"uptime_s", up}});
            }

            // GET /info
            if (req.method() == http::verb::get && req.target() == "/info")
                return respond_json(http::status::ok, state.info());

            // 404 fallback
            respond_json(http::status::not_found, json{{"error", "not found"}});
        }
    };
};
