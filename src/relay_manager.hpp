/*
 * File: src/relay_manager.hpp
 * Project: ChartLink Relay
 * Purpose: Connection state machine, single live stream, snapshot exposure
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - At most one stream is live; a new one always closes the old one first
 *  - No retries: the caller decides when to try again
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>

#include "common/snapshot.hpp"
#include "common/url.hpp"
#include "relay_discovery.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"

class ConnectionManager
{
    RelayConfig config_;
    SnapshotStore store_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread io_thread_;

    std::mutex conn_mtx_;
    std::shared_ptr<WsConnection> conn_;
    uint64_t generation_ = 0; // id of the only connection whose callbacks count

public:
    explicit ConnectionManager(RelayConfig config = {})
        : config_(std::move(config)), work_(boost::asio::make_work_guard(ioc_))
    {
        io_thread_ = std::thread([this]
                                 {
            for (;;)
            {
                try
                {
                    ioc_.run();
                    break;
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[relay] io handler error: " << e.what() << "\n";
                }
            } });
    }

    ~ConnectionManager()
    {
        {
            std::scoped_lock lk(conn_mtx_);
            close_current();
        }
        // let the posted close handshake finish, bounded, before stopping
        work_.reset();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        while (!ioc_.stopped() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        ioc_.stop();
        if (io_thread_.joinable())
            io_thread_.join();
    }

    ConnectionManager(const ConnectionManager &) = delete;
    ConnectionManager &operator=(const ConnectionManager &) = delete;

    // Blocks for up to the discovery timeout. Returns ok:<url>, not_found or
    // error:<message>; never throws.
    ConnectResult discover_and_connect()
    {
        {
            std::scoped_lock lk(conn_mtx_);
            close_current();
        }
        store_.set_state(ConnectionState::discovering);
        store_.clear_error();
        store_.reset_log();
        log("discoverAndConnect() called");

        try
        {
            DiscoveryClient client(config_.discovery_token, config_.extra_targets,
                                   [this](const std::string &line)
                                   { log(line); },
                                   config_.discovery_bind_address);
            auto server = client.discover(config_.discovery_port, config_.discovery_timeout);
            if (!server)
            {
                log("No server discovered (ws_url is blank)");
                store_.set_state(ConnectionState::disconnected);
                return ConnectResult::not_found();
            }

            log("Discovered ws_url: " + server->stream_url + ", start WebSocket connect");
            auto fault = open_stream(server->stream_url);
            if (!fault.empty())
            {
                log("WebSocket connect() failed");
                return ConnectResult::error(fault);
            }
            log("WebSocket connect() invoked successfully");
            return ConnectResult::ok(server->stream_url);
        }
        catch (const std::exception &e)
        {
            std::string msg = e.what();
            if (msg.empty())
                msg = "unknown_error";
            std::cerr << "[relay] discoverAndConnect error: " << msg << "\n";
            store_.set_error(msg);
            store_.set_state(ConnectionState::error);
            log("Exception in discoverAndConnect: " + msg);
            return ConnectResult::error(msg);
        }
    }

    // Skips discovery. "ok" means the open was issued; the outcome shows up
    // in the connection state.
    ConnectResult connect_with_url(const std::string &url)
    {
        {
            std::scoped_lock lk(conn_mtx_);
            close_current();
        }
        store_.clear_error();

        auto fault = open_stream(url);
        if (!fault.empty())
            return ConnectResult::error(fault);
        return ConnectResult::ok();
    }

    // Queues an outbound text frame. False unless a stream is connected.
    bool send_command(const std::string &text)
    {
        std::scoped_lock lk(conn_mtx_);
        if (!conn_ || store_.state() != ConnectionState::connected)
            return false;
        conn_->send(text);
        return true;
    }

    void disconnect()
    {
        std::scoped_lock lk(conn_mtx_);
        close_current();
    }

    std::string connection_state() const { return to_string(store_.state()); }
    std::string latest_frame_json() const { return store_.frame(); }
    std::string last_error() const { return store_.error(); }
    std::string discover_debug_log() const { return store_.log_text(); }

private:
    void log(const std::string &line) { store_.log(line); }

    // conn_mtx_ must be held. An error state survives the close and is never
    // replaced by a transient closing.
    void close_current()
    {
        store_.set_state_unless(ConnectionState::closing, ConnectionState::error);
        if (conn_)
        {
            conn_->close(websocket::close_code::normal, config_.close_reason);
            conn_.reset();
        }
        ++generation_;
        store_.set_state_unless(ConnectionState::disconnected, ConnectionState::error);
    }

    // Returns the fault text, empty when the open request was issued.
    std::string open_stream(const std::string &url)
    {
        std::scoped_lock lk(conn_mtx_);
        store_.set_state(ConnectionState::connecting);
        store_.set_frame({});
        try
        {
            log("connectWebSocket() with url=" + url);
            auto parts = parse_url(url);
            conn_ = std::make_shared<WsConnection>(ioc_, std::move(parts), ++generation_, make_events());
            conn_->run();
            return {};
        }
        catch (const std::exception &e)
        {
            std::string msg = e.what();
            if (msg.empty())
                msg = "connect_exception";
            std::cerr << "[relay] connectWebSocket error: " << msg << "\n";
            conn_.reset();
            store_.set_error(msg);
            store_.set_state(ConnectionState::error);
            log("connectWebSocket() exception: " + msg);
            return msg;
        }
    }

    WsEvents make_events()
    {
        WsEvents ev;
        ev.on_open = [this](uint64_t id, unsigned status)
        {
            std::scoped_lock lk(conn_mtx_);
            if (id != generation_)
                return;
            store_.set_state(ConnectionState::connected);
            log("WebSocket onOpen: connected, response code=" + std::to_string(status));
            std::cerr << "[ws] connected\n";
        };
        ev.on_text = [this](uint64_t id, std::string text)
        {
            std::scoped_lock lk(conn_mtx_);
            if (id == generation_)
                store_.set_frame(std::move(text));
        };
        // text-only protocol; binary frames leave the snapshot alone
        ev.on_binary = [this](uint64_t id, std::size_t bytes)
        {
            std::scoped_lock lk(conn_mtx_);
            if (id != generation_)
                return;
            log("WebSocket binary message ignored: " + std::to_string(bytes) + " bytes");
            std::cerr << "[ws] binary message: " << bytes << " bytes\n";
        };
        ev.on_closing = [this](uint64_t id, uint16_t code, std::string reason)
        {
            std::scoped_lock lk(conn_mtx_);
            if (id != generation_)
                return;
            store_.set_state(ConnectionState::closing);
            conn_.reset();
            store_.set_state(ConnectionState::disconnected);
            log("WebSocket onClosing: code=" + std::to_string(code) + ", reason=" + reason);
            std::cerr << "[ws] closed by peer: " << code << " / " << reason << "\n";
        };
        ev.on_failure = [this](uint64_t id, std::string what)
        {
            std::scoped_lock lk(conn_mtx_);
            if (id != generation_)
                return;
            conn_.reset();
            store_.set_error(what.empty() ? std::string("websocket_error") : what);
            store_.set_state(ConnectionState::error);
            log("WebSocket onFailure: " + what);
            std::cerr << "[ws] error: " << what << "\n";
        };
        return ev;
    }
};
