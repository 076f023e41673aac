/*
 * File: include/common/frame.hpp
 * Project: ChartLink Relay
 * Purpose: frame_update schema for producers and diagnostic consumers
 * Notes:
 *  - See DESIGN.md for the component layout
 *  - The relay path never parses frames; it stores the raw text
 * Last updated: 2026-10-18
 */

#pragma once
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct Note {
int64_t id{0};
int note_type{0};
double time{0};
double distance{0};
double degree{0};
double delta{0};
double radius_multiplier{1};
std::string kind{"tap"};
nlohmann::json base = nlohmann::json::object(); // authoring parameters, shape depends on kind
};


struct Frame {
double timestamp{0};
double start_chart_time{0};
double start_distance{0};
double cur_degree{0};
double speed{1};
std::vector<Note> notes;
};


inline nlohmann::json note_to_json(const Note& n){
using nlohmann::json;
return json{
{"id", n.id},
{"note_type", n.note_type},
{"time", n.time},
{"distance", n.distance},
{"degree", n.degree},
{"delta", n.delta},
{"radius_multiplier", n.radius_multiplier},
{"kind", n.kind},
{"base", n.base}
};
}


inline nlohmann::json frame_to_json(const Frame& f){
using nlohmann::json;
json notes = json::array();
for (const auto& n : f.notes) notes.push_back(note_to_json(n));
return json{
{"type", "frame_update"},
{"timestamp", f.timestamp},
{"start_chart_time", f.start_chart_time},
{"start_distance", f.start_distance},
{"cur_degree", f.cur_degree},
{"speed", f.speed},
{"notes", notes}
};
}


// One-line description of a frame for console output. Never throws; a frame
// that does not parse is reported as such.
inline std::string summarize_frame(const std::string& text){
auto j = nlohmann::json::parse(text, nullptr, false);
if (j.is_discarded() || !j.is_object()) {
return "unparseable frame (" + std::to_string(text.size()) + " bytes)";
}
try {
std::ostringstream oss;
oss << j.value("type", std::string("?"))
<< " t=" << j.value("timestamp", 0.0)
<< " chart_time=" << j.value("start_chart_time", 0.0)
<< " speed=" << j.value("speed", 0.0);
auto it = j.find("notes");
oss << " notes=" << ((it != j.end() && it->is_array()) ? it->size() : 0);
return oss.str();
} catch (const nlohmann::json::exception& e) {
return std::string("malformed frame: ") + e.what();
}
}
