/*
 * File: include/common/snapshot.hpp
 * Project: ChartLink Relay
 * Purpose: Connection state, latest frame, last error and discovery log
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Latest frame is overwrite-only; no history is kept
 *  - Every accessor returns a copy taken under a short lock
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

enum class ConnectionState
{
    disconnected,
    discovering,
    connecting,
    connected,
    closing,
    error
};

inline const char *to_string(ConnectionState s)
{
    switch (s)
    {
    case ConnectionState::disconnected:
        return "disconnected";
    case ConnectionState::discovering:
        return "discovering";
    case ConnectionState::connecting:
        return "connecting";
    case ConnectionState::connected:
        return "connected";
    case ConnectionState::closing:
        return "closing";
    case ConnectionState::error:
        return "error";
    }
    return "disconnected";
}

// "[<epoch ms>] message" lines, newline-joined. Timestamps never go backwards,
// even when the wall clock is stepped.
class DiagnosticLog
{
    std::string text_;
    std::int64_t last_ms_{0};

public:
    void append(const std::string &message)
    {
        using namespace std::chrono;
        auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
        last_ms_ = std::max<std::int64_t>(last_ms_, ms);
        if (!text_.empty())
            text_ += '\n';
        text_ += "[" + std::to_string(last_ms_) + "] " + message;
    }
    void clear() { text_.clear(); }
    const std::string &text() const { return text_; }
};

class SnapshotStore
{
    mutable std::mutex m_;
    ConnectionState state_{ConnectionState::disconnected};
    std::string frame_;
    std::string error_;
    DiagnosticLog log_;

public:
    void set_state(ConnectionState s)
    {
        std::scoped_lock lk(m_);
        state_ = s;
    }
    // Moves to `next` unless the current state is `sticky`.
    void set_state_unless(ConnectionState next, ConnectionState sticky)
    {
        std::scoped_lock lk(m_);
        if (state_ != sticky)
            state_ = next;
    }
    ConnectionState state() const
    {
        std::scoped_lock lk(m_);
        return state_;
    }

    void set_frame(std::string text)
    {
        std::scoped_lock lk(m_);
        frame_ = std::move(text);
    }
    std::string frame() const
    {
        std::scoped_lock lk(m_);
        return frame_;
    }

    void set_error(std::string message)
    {
        std::scoped_lock lk(m_);
        error_ = std::move(message);
    }
    void clear_error() { set_error({}); }
    std::string error() const
    {
        std::scoped_lock lk(m_);
        return error_;
    }

    void log(const std::string &message)
    {
        std::scoped_lock lk(m_);
        log_.append(message);
    }
    void reset_log()
    {
        std::scoped_lock lk(m_);
        log_.clear();
    }
    std::string log_text() const
    {
        std::scoped_lock lk(m_);
        return log_.text();
    }
};
