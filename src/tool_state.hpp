/*
 * File: src/tool_state.hpp
 * Project: ChartLink Relay
 * Purpose: Shared state of the charting tool emulator
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Discovery: UDP token on 55555, JSON reply carrying ws_url
 *  - /health returns constant JSON plus uptime
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>


struct ToolConfig {
std::string name{"ChartTool Emulator"};
std::string version{"0.2.5"};
std::string bind_host{"0.0.0.0"};
std::string advertise_host{"127.0.0.1"}; // host placed in ws_url / http_info_url
std::string token{"RotaenoChartTool_DISCOVER_V1"};
uint16_t discovery_port = 55555;
uint16_t ws_port = 8080;
uint16_t http_port = 8081;
int fps = 30;
};


struct ToolState {
ToolConfig config;
uint16_t ws_port = 0;   // bound ports, known after the servers start
uint16_t http_port = 0;
std::atomic<uint64_t> accepted{0};
std::mutex rx_mtx;
std::vector<std::string> commands; // text frames received from clients
std::vector<std::pair<uint16_t, std::string>> closes; // close frames received from clients (code, reason)
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

std::string ws_url() const { return "ws://" + config.advertise_host + ":" + std::to_string(ws_port) + "/ws"; }
std::string info_url() const { return "http://" + config.advertise_host + ":" + std::to_string(http_port) + "/info"; }

nlohmann::json info() const {
return nlohmann::json{{"name", config.name}, {"version", config.version}, {"ws_url", ws_url()}};
}

std::string discovery_reply() const {
auto j = info();
j["http_info_url"] = info_url();
return j.dump();
}

void record_command(std::string text){ std::scoped_lock lk(rx_mtx); commands.push_back(std::move(text)); }
std::vector<std::string> received_commands(){ std::scoped_lock lk(rx_mtx); return commands; }
void record_close(uint16_t code, std::string reason){ std::scoped_lock lk(rx_mtx); closes.emplace_back(code, std::move(reason)); }
std::vector<std::pair<uint16_t, std::string>> received_closes(){ std::scoped_lock lk(rx_mtx); return closes; }
};
