#include "cuerpo/recording.hpp"

#include <fstream>
#include <iostream>
#include <utility>
#include <nlohmann/json.hpp>

namespace cuerpo {

using json = nlohmann::json;

namespace {

float number_or(const json& obj, const char* key, float fallback) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_number()) ? it->get<float>() : fallback;
}

} // namespace

bool parse_frame(const std::string& line, LandmarkFrame& frame, std::string* error) {
    auto fail = [error](const std::string& why) {
        if (error) *error = why;
        return false;
    };

    json j = json::parse(line, nullptr, false);
    if (j.is_discarded()) return fail("invalid JSON");
    if (!j.is_object()) return fail("frame is not an object");
    if (!j.contains("t") || !j["t"].is_number()) return fail("missing numeric \"t\"");
    if (!j.contains("landmarks") || !j["landmarks"].is_array()) return fail("missing \"landmarks\" array");

    LandmarkFrame parsed;
    parsed.timestamp = j["t"].get<double>();
    parsed.landmarks.reserve(j["landmarks"].size());
    for (const auto& item : j["landmarks"]) {
        if (!item.is_object()) return fail("landmark is not an object");
        if (!item.contains("id") || !item["id"].is_number_integer()) return fail("landmark without integer \"id\"");
        if (!item.contains("x") || !item["x"].is_number() ||
            !item.contains("y") || !item["y"].is_number()) {
            return fail("landmark " + std::to_string(item["id"].get<int>()) + " without x/y");
        }
        Landmark lm;
        lm.id = item["id"].get<int>();
        lm.x = item["x"].get<float>();
        lm.y = item["y"].get<float>();
        lm.z = number_or(item, "z", 0.0f);
        lm.visibility = number_or(item, "v", 1.0f);
        parsed.landmarks.push_back(lm);
    }

    frame = std::move(parsed);
    return true;
}

std::string frame_to_json(const LandmarkFrame& frame) {
    json j;
    j["t"] = frame.timestamp;
    j["landmarks"] = json::array();
    for (const auto& lm : frame.landmarks) {
        j["landmarks"].push_back({
            {"id", lm.id},
            {"x", lm.x},
            {"y", lm.y},
            {"z", lm.z},
            {"v", lm.visibility}
        });
    }
    return j.dump();
}

RecordingReader::RecordingReader(std::istream& in)
    : in_(in) {}

bool RecordingReader::next(LandmarkFrame& frame) {
    std::string line;
    while (std::getline(in_, line)) {
        ++line_no_;
        std::size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;

        std::string error;
        if (parse_frame(line, frame, &error)) return true;
        ++skipped_;
        std::cerr << "[Recording] line " << line_no_ << ": " << error << "\n";
    }
    return false;
}

bool load_recording(const std::string& path, std::vector<LandmarkFrame>& frames) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Recording] Failed to open: " << path << "\n";
        return false;
    }
    RecordingReader reader(file);
    LandmarkFrame frame;
    while (reader.next(frame)) frames.push_back(frame);
    return true;
}

bool save_recording(const std::string& path, const std::vector<LandmarkFrame>& frames) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Recording] Failed to save to: " << path << "\n";
        return false;
    }
    for (const auto& frame : frames) {
        file << frame_to_json(frame) << "\n";
    }
    return static_cast<bool>(file);
}

} // namespace cuerpo
