#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include "common/url.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

// Every callback carries the id of the connection that raised it.
struct WsEvents
{
    std::function<void(uint64_t id, unsigned status)> on_open;
    std::function<void(uint64_t id, std::string text)> on_text;
    std::function<void(uint64_t id, std::size_t bytes)> on_binary;
    std::function<void(uint64_t id, uint16_t code, std::string reason)> on_closing;
    std::function<void(uint64_t id, std::string what)> on_failure;
};

// One outbound WebSocket. All work runs on the io_context it was built with;
// the public calls only post to it.
class WsConnection : public std::enable_shared_from_this<WsConnection>
{
    tcp::resolver resolver_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    websocket::response_type handshake_res_;
    UrlParts url_;
    uint64_t id_;
    WsEvents events_;
    std::deque<std::string> outbox_;
    unsigned rejected_status_ = 0;
    bool closing_ = false;

public:
    WsConnection(boost::asio::io_context &ioc, UrlParts url, uint64_t id, WsEvents events)
        : resolver_(ioc), ws_(ioc), url_(std::move(url)), id_(id), events_(std::move(events)) {}

    uint64_t id() const { return id_; }

    void run()
    {
        boost::asio::post(ws_.get_executor(), [self = shared_from_this()]
                          { self->do_resolve(); });
    }

    void send(std::string text)
    {
        boost::asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable
                          {
            self->outbox_.push_back(std::move(text));
            if (self->outbox_.size() == 1)
                self->do_write(); });
    }

    // Best effort; nothing is reported back once this is called.
    void close(websocket::close_code code, std::string reason)
    {
        boost::asio::post(ws_.get_executor(), [self = shared_from_this(), code, reason = std::move(reason)]
                          {
            self->closing_ = true;
            self->resolver_.cancel();
            if (self->ws_.is_open())
            {
                self->ws_.async_close(websocket::close_reason(code, reason), [self](beast::error_code) {});
            }
            else
            {
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws_).socket().close(ignored);
            } });
    }

private:
    void do_resolve()
    {
        auto self = shared_from_this();
        resolver_.async_resolve(url_.host, url_.port, [self](beast::error_code ec, tcp::resolver::results_type results)
                                {
            if (ec)
                return self->fail(ec);
            self->do_connect(results); });
    }

    void do_connect(const tcp::resolver::results_type &results)
    {
        if (closing_)
            return;
        auto self = shared_from_this();
        beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));
        beast::get_lowest_layer(ws_).async_connect(results, [self](beast::error_code ec, const tcp::endpoint &)
                                                   {
            if (ec)
                return self->fail(ec);
            self->do_handshake(); });
    }

    void do_handshake()
    {
        auto self = shared_from_this();
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws_.async_handshake(handshake_res_, url_.host_header(), url_.target, [self](beast::error_code ec)
                            {
            if (ec == websocket::error::upgrade_declined)
                self->rejected_status_ = self->handshake_res_.result_int();
            if (ec)
                return self->fail(ec);
            if (self->events_.on_open)
                self->events_.on_open(self->id_, self->handshake_res_.result_int());
            self->do_read(); });
    }

    void do_read()
    {
        auto self = shared_from_this();
        ws_.async_read(buffer_, [self](beast::error_code ec, std::size_t n)
                       { self->on_read(ec, n); });
    }

    void on_read(beast::error_code ec, std::size_t n)
    {
        if (ec == websocket::error::closed)
        {
            // peer sent a close frame; beast has already echoed it
            if (!closing_ && events_.on_closing)
                events_.on_closing(id_, static_cast<uint16_t>(ws_.reason().code), std::string(ws_.reason().reason.c_str()));
            return;
        }
        if (ec)
            return fail(ec);

        if (ws_.got_text())
        {
            if (events_.on_text)
                events_.on_text(id_, beast::buffers_to_string(buffer_.data()));
        }
        else if (events_.on_binary)
        {
            events_.on_binary(id_, n);
        }
        buffer_.consume(buffer_.size());
        do_read();
    }

    void do_write()
    {
        auto self = shared_from_this();
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(outbox_.front()), [self](beast::error_code ec, std::size_t)
                        {
            if (ec)
                return self->fail(ec);
            self->outbox_.pop_front();
            if (!self->outbox_.empty())
                self->do_write(); });
    }

    void fail(beast::error_code ec)
    {
        if (closing_ || ec == boost::asio::error::operation_aborted)
            return;
        std::string what = std::string(ec.category().name()) + ": " + ec.message();
        if (rejected_status_ != 0)
            what += " (code=" + std::to_string(rejected_status_) + ")";
        if (events_.on_failure)
            events_.on_failure(id_, what);
    }
};
