/*
 * File: tests/test_snapshot_store.cpp
 * Project: ChartLink Relay
 * Purpose: Snapshot store and diagnostic log
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - Latest frame is overwrite-only; no history is kept
 * Last updated: 2026-10-18
 */

#include <catch2/catch.hpp>
#include <atomic>
#include <sstream>
#include <thread>
#include <vector>
#include "common/frame.hpp"
#include "common/snapshot.hpp"


static std::vector<long long> log_stamps(const std::string& text){
std::vector<long long> out; std::istringstream in(text); std::string line;
while (std::getline(in, line)) { REQUIRE(line.front()=='['); out.push_back(std::stoll(line.substr(1, line.find(']')-1))); }
return out;
}


TEST_CASE("store starts empty and disconnected"){
SnapshotStore s;
REQUIRE(s.state()==ConnectionState::disconnected);
REQUIRE(s.frame().empty()); REQUIRE(s.error().empty()); REQUIRE(s.log_text().empty());
}


TEST_CASE("latest frame is the last one written"){
SnapshotStore s; s.set_frame("A"); s.set_frame("B");
REQUIRE(s.frame()=="B");
s.set_frame("{\"type\":\"frame_update\"}");
REQUIRE(s.frame()=="{\"type\":\"frame_update\"}");
}


TEST_CASE("state names"){
REQUIRE(std::string(to_string(ConnectionState::disconnected))=="disconnected");
REQUIRE(std::string(to_string(ConnectionState::discovering))=="discovering");
REQUIRE(std::string(to_string(ConnectionState::connecting))=="connecting");
REQUIRE(std::string(to_string(ConnectionState::connected))=="connected");
REQUIRE(std::string(to_string(ConnectionState::closing))=="closing");
REQUIRE(std::string(to_string(ConnectionState::error))=="error");
}


TEST_CASE("error state is sticky for set_state_unless"){
SnapshotStore s;
s.set_state(ConnectionState::error);
s.set_state_unless(ConnectionState::disconnected, ConnectionState::error);
REQUIRE(s.state()==ConnectionState::error);
s.set_state(ConnectionState::connected);
s.set_state_unless(ConnectionState::disconnected, ConnectionState::error);
REQUIRE(s.state()==ConnectionState::disconnected);
}


TEST_CASE("log appends timestamped lines and resets to empty"){
SnapshotStore s;
s.log("send issued"); s.log("targets enumerated"); s.log("timeout");
auto text = s.log_text();
REQUIRE(text.find("] send issued\n[")!=std::string::npos);
REQUIRE(text.substr(text.size()-std::string("] timeout").size())=="] timeout");
auto stamps = log_stamps(text);
REQUIRE(stamps.size()==3);
REQUIRE(stamps[0]<=stamps[1]); REQUIRE(stamps[1]<=stamps[2]);

auto before = s.log_text(); s.log("more");
REQUIRE(s.log_text().rfind(before, 0)==0);

s.reset_log();
REQUIRE(s.log_text().empty());
s.log("fresh");
REQUIRE(log_stamps(s.log_text()).size()==1);
}


TEST_CASE("readers never see a torn frame"){
SnapshotStore s;
std::atomic<bool> stop{false};
std::thread writer([&]{
for (int i = 0; !stop; ++i) s.set_frame(std::string(static_cast<size_t>(1 + i % 97), static_cast<char>('a' + i % 26)));
});
for (int k = 0; k < 20000; ++k) {
auto f = s.frame();
if (f.empty()) continue;
REQUIRE(f.find_first_not_of(f.front())==std::string::npos);
}
stop = true; writer.join();
}


TEST_CASE("frame summary tolerates bad input"){
Frame f; f.timestamp = 1.5; f.notes.resize(3);
auto line = summarize_frame(frame_to_json(f).dump());
REQUIRE(line.find("frame_update")!=std::string::npos);
REQUIRE(line.find("notes=3")!=std::string::npos);
REQUIRE(summarize_frame("{not json").rfind("unparseable", 0)==0);
REQUIRE(summarize_frame(R"({"timestamp":"soon"})").rfind("malformed", 0)==0);
}
