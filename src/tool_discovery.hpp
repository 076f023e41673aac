#pragma once
#include <array>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>

using udp = boost::asio::ip::udp;

// Answers each datagram that equals the discovery token with reply().
class DiscoveryResponder
{
    udp::socket socket_;
    udp::endpoint sender_;
    std::array<char, 1024> buf_{};
    std::string token_;
    std::function<std::string()> reply_;

public:
    DiscoveryResponder(boost::asio::io_context &ioc, udp::endpoint ep, std::string token, std::function<std::string()> reply)
        : socket_(ioc), token_(std::move(token)), reply_(std::move(reply))
    {
        socket_.open(ep.protocol());
        socket_.set_option(boost::asio::socket_base::reuse_address(true));
        socket_.bind(ep);
        do_receive();
    }

    uint16_t port() const { return socket_.local_endpoint().port(); }

    void stop()
    {
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

private:
    void do_receive()
    {
        socket_.async_receive_from(boost::asio::buffer(buf_), sender_, [this](boost::system::error_code ec, std::size_t n)
                                   {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (ec)
                std::cerr << "[tool] discovery receive error: " << ec.message() << "\n";
            else
                handle(n);
            do_receive(); });
    }

    void handle(std::size_t n)
    {
        std::string request(buf_.data(), n);
        if (request != token_)
        {
            std::cerr << "[tool] ignoring datagram from " << sender_ << "\n";
            return;
        }
        auto reply = std::make_shared<std::string>(reply_());
        socket_.async_send_to(boost::asio::buffer(*reply), sender_, [reply](boost::system::error_code ec, std::size_t)
                              {
            if (ec)
                std::cerr << "WARN: discovery reply failed: " << ec.message() << "\n"; });
    }
};
