#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <algorithm>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>
#include "tool_state.hpp"

namespace websocket = boost::beast::websocket;

// Pushes frames to every connected client; records what clients send back.
class FrameServer
{
    struct Session;

    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    ToolState &state_;
    std::mutex sessions_mtx_;
    std::vector<std::weak_ptr<Session>> sessions_;

public:
    FrameServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ToolState &s)
        : acceptor_(ioc), socket_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void broadcast(const std::string &msg) { for_each_session([&](Session &s)
                                                              { s.send(msg, true); }); }
    void broadcast_binary(const std::string &bytes) { for_each_session([&](Session &s)
                                                                       { s.send(bytes, false); }); }
    void close_all(websocket::close_code code, const std::string &reason)
    {
        for_each_session([&](Session &s)
                         { s.close(code, reason); });
    }

    std::size_t session_count()
    {
        std::scoped_lock lk(sessions_mtx_);
        prune();
        return sessions_.size();
    }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
        close_all(websocket::close_code::going_away, "tool shutting down");
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<Session>(std::move(socket_), state_, *this)->run();
            do_accept(); });
    }

    void add(const std::shared_ptr<Session> &s)
    {
        std::scoped_lock lk(sessions_mtx_);
        prune();
        sessions_.push_back(s);
        ++state_.accepted;
    }

    void prune()
    {
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(), [](const std::weak_ptr<Session> &w)
                                       { return w.expired(); }),
                        sessions_.end());
    }

    template <class F>
    void for_each_session(F &&f)
    {
        std::scoped_lock lk(sessions_mtx_);
        for (auto &w : sessions_)
        {
            if (auto s = w.lock())
                f(*s);
        }
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        ToolState &state;
        FrameServer &server;
        std::deque<std::pair<std::string, bool>> outbox; // payload, is_text
        bool open = false;

        Session(boost::asio::ip::tcp::socket &&s, ToolState &st, FrameServer &sv)
            : ws(std::move(s)), state(st), server(sv) {}

        void run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept([self](boost::beast::error_code ec)
                            {
                if (ec)
                    return;
                self->open = true;
                self->server.add(self);
                self->do_read(); });
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::beast::error_code ec, std::size_t)
                          {
                if (ec == websocket::error::closed)
                {
                    auto r = self->ws.reason();
                    std::cout << "[tool] client closed: " << r.code << " " << r.reason.c_str() << "\n";
                    self->state.record_close(static_cast<uint16_t>(r.code), std::string(r.reason.c_str()));
                    return;
                }
                if (!ec)
                {
                    self->on_msg();
                    self->do_read();
                } });
        }

        void on_msg()
        {
            auto data = boost::beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            if (ws.got_text())
            {
                std::cout << "[tool] command: " << data << "\n";
                state.record_command(std::move(data));
            }
        }

        void send(const std::string &s, bool text)
        {
            boost::asio::post(ws.get_executor(), [self = shared_from_this(), s, text]
                              {
                if (!self->open)
                    return;
                self->outbox.emplace_back(s, text);
                if (self->outbox.size() == 1)
                    self->do_write(); });
        }

        void do_write()
        {
            auto self = shared_from_this();
            ws.text(outbox.front().second);
            ws.async_write(boost::asio::buffer(outbox.front().first), [self](boost::beast::error_code ec, std::size_t)
                           {
                if (ec)
                {
                    self->outbox.clear();
                    return;
                }
                self->outbox.pop_front();
                if (!self->outbox.empty())
                    self->do_write(); });
        }

        void close(websocket::close_code code, const std::string &reason)
        {
            boost::asio::post(ws.get_executor(), [self = shared_from_this(), code, reason]
                              {
                if (!self->open)
                    return;
                self->open = false;
                self->ws.async_close(websocket::close_reason(code, reason), [self](boost::beast::error_code) {}); });
        }
    };
};
