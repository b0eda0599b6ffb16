#include "cuerpo/session_config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace cuerpo {

namespace {

const std::string kAlphaPrefix = "alpha.";

bool valid_alpha(float a) {
    return std::isfinite(a) && a > 0.0f && a <= 1.0f;
}

void report(std::vector<std::string>* errors, const std::string& message) {
    if (errors) errors->push_back(message);
}

void write_optional(std::ofstream& file, const char* key, const std::optional<float>& value) {
    if (value) {
        file << key << " " << *value << "\n";
    } else {
        file << "# " << key << " <required>\n";
    }
}

} // namespace

float SessionConfig::alpha_for(Feature f) const {
    auto it = alpha_overrides.find(feature_name(f));
    if (it != alpha_overrides.end()) return it->second;
    return alpha_default.value_or(1.0f);
}

bool SessionConfig::validate(std::vector<std::string>* errors) const {
    bool ok = true;
    auto fail = [&](const std::string& message) {
        report(errors, message);
        ok = false;
    };

    if (!hysteresis_margin) {
        fail("hysteresis_margin is required");
    } else if (!(*hysteresis_margin >= 0.0f && *hysteresis_margin < constants::kZoneWidth / 2.0f)) {
        fail("hysteresis_margin must be in [0, 0.125)");
    }
    if (!jerk_onset_threshold) {
        fail("jerk_onset_threshold is required");
    } else if (!(*jerk_onset_threshold >= 0.0f && *jerk_onset_threshold < 1.0f)) {
        fail("jerk_onset_threshold must be in [0, 1)");
    }
    if (!min_retrigger_interval) {
        fail("min_retrigger_interval is required");
    } else if (!(*min_retrigger_interval >= 0.0f)) {
        fail("min_retrigger_interval must not be negative");
    }

    if (alpha_default && !valid_alpha(*alpha_default)) {
        fail("alpha.default must be in (0, 1]");
    }
    for (const auto& kv : alpha_overrides) {
        Feature f;
        if (!feature_from_name(kv.first, f)) {
            fail("alpha." + kv.first + " names no feature");
        } else if (!valid_alpha(kv.second)) {
            fail("alpha." + kv.first + " must be in (0, 1]");
        }
    }
    if (!alpha_default) {
        for (const auto& d : feature_descriptors()) {
            if (alpha_overrides.find(d.name) == alpha_overrides.end()) {
                fail(std::string("alpha.") + d.name + " is required (or alpha.default)");
            }
        }
    }

    if (buffer_capacity < constants::kMinBufferCapacity) fail("buffer_capacity must be at least 3");
    if (!(visibility_threshold >= 0.0f && visibility_threshold <= 1.0f)) {
        fail("visibility_threshold must be in [0, 1]");
    }
    if (!(gap_tolerance > 0.0f)) fail("gap_tolerance must be positive");
    if (!(velocity_scale > 0.0f)) fail("velocity_scale must be positive");
    if (!(jerk_scale > 0.0f)) fail("jerk_scale must be positive");
    if (!(energy_scale > 0.0f)) fail("energy_scale must be positive");
    if (!(tilt_full_scale_deg > 0.0f && tilt_full_scale_deg <= 90.0f)) {
        fail("tilt_full_scale_deg must be in (0, 90]");
    }
    if (!(hand_y_bottom > hand_y_top)) fail("hand_y_bottom must be below (greater than) hand_y_top");

    if (!(note_duration_min > 0.0f)) fail("note_duration_min must be positive");
    if (!(note_duration_max >= note_duration_min)) fail("note_duration_max must be >= note_duration_min");
    if (note_velocity_min < 1 || note_velocity_min > constants::kMidiMaxVelocity) {
        fail("note_velocity_min must be in [1, 127]");
    }

    if (!(moderate_tilt_threshold > 0.0f && moderate_tilt_threshold <= 1.0f)) {
        fail("moderate_tilt_threshold must be in (0, 1]");
    }
    if (!(extreme_tilt_threshold >= moderate_tilt_threshold && extreme_tilt_threshold < 1.0f)) {
        fail("extreme_tilt_threshold must be in [moderate_tilt_threshold, 1)");
    }
    if (!(chord_bend_range >= 0.0f && chord_bend_range <= 1.0f)) fail("chord_bend_range must be in [0, 1]");
    if (!(melody_bend_range >= 0.0f && melody_bend_range <= 1.0f)) fail("melody_bend_range must be in [0, 1]");
    if (!(elbow_deadzone >= 0.0f && elbow_deadzone < 1.0f)) fail("elbow_deadzone must be in [0, 1)");
    if (!(vibrato_rate_threshold > 0.0f)) fail("vibrato_rate_threshold must be positive");
    if (vibrato_window < 3) fail("vibrato_window must be at least 3");
    if (vibrato_min_reversals < 1 || vibrato_min_reversals >= vibrato_window) {
        fail("vibrato_min_reversals must be in [1, vibrato_window)");
    }

    return ok;
}

bool SessionConfig::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << "\n";
        return false;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string key;
        if (!(iss >> key)) continue;

        float value = 0.0f;
        if (key == "hysteresis_margin") {
            if (iss >> value) hysteresis_margin = value;
        }
        else if (key == "jerk_onset_threshold") {
            if (iss >> value) jerk_onset_threshold = value;
        }
        else if (key == "min_retrigger_interval") {
            if (iss >> value) min_retrigger_interval = value;
        }
        else if (key == "alpha.default") {
            if (iss >> value) alpha_default = value;
        }
        else if (key.compare(0, kAlphaPrefix.size(), kAlphaPrefix) == 0) {
            if (iss >> value) alpha_overrides[key.substr(kAlphaPrefix.size())] = value;
        }
        else if (key == "buffer_capacity") iss >> buffer_capacity;
        else if (key == "visibility_threshold") iss >> visibility_threshold;
        else if (key == "gap_tolerance") iss >> gap_tolerance;
        else if (key == "velocity_scale") iss >> velocity_scale;
        else if (key == "jerk_scale") iss >> jerk_scale;
        else if (key == "energy_scale") iss >> energy_scale;
        else if (key == "tilt_full_scale_deg") iss >> tilt_full_scale_deg;
        else if (key == "hand_y_bottom") iss >> hand_y_bottom;
        else if (key == "hand_y_top") iss >> hand_y_top;
        else if (key == "note_duration_max") iss >> note_duration_max;
        else if (key == "note_duration_min") iss >> note_duration_min;
        else if (key == "note_velocity_min") iss >> note_velocity_min;
        else if (key == "moderate_tilt_threshold") iss >> moderate_tilt_threshold;
        else if (key == "extreme_tilt_threshold") iss >> extreme_tilt_threshold;
        else if (key == "chord_bend_range") iss >> chord_bend_range;
        else if (key == "melody_bend_range") iss >> melody_bend_range;
        else if (key == "elbow_deadzone") iss >> elbow_deadzone;
        else if (key == "vibrato_rate_threshold") iss >> vibrato_rate_threshold;
        else if (key == "vibrato_window") iss >> vibrato_window;
        else if (key == "vibrato_min_reversals") iss >> vibrato_min_reversals;
        else if (key == "require_full_frame") iss >> require_full_frame;
        else if (key == "verbose") iss >> verbose;
        else {
            std::cerr << "[Config] " << path << ":" << line_no << ": unknown key '" << key << "'\n";
            continue;
        }

        if (iss.fail()) {
            std::cerr << "[Config] " << path << ":" << line_no << ": bad value for '" << key << "'\n";
            return false;
        }
    }

    return validate();
}

void SessionConfig::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to save to: " << path << "\n";
        return;
    }

    file << "# Cuerpo Sonoro Session Configuration\n";
    file << "# Performer tuning\n";
    write_optional(file, "hysteresis_margin", hysteresis_margin);
    write_optional(file, "jerk_onset_threshold", jerk_onset_threshold);
    write_optional(file, "min_retrigger_interval", min_retrigger_interval);
    write_optional(file, "alpha.default", alpha_default);
    for (const auto& kv : alpha_overrides) {
        file << kAlphaPrefix << kv.first << " " << kv.second << "\n";
    }
    file << "\n# Landmark history\n";
    file << "buffer_capacity " << buffer_capacity << "\n";
    file << "visibility_threshold " << visibility_threshold << "\n";
    file << "gap_tolerance " << gap_tolerance << "\n";
    file << "\n# Feature normalization\n";
    file << "velocity_scale " << velocity_scale << "\n";
    file << "jerk_scale " << jerk_scale << "\n";
    file << "energy_scale " << energy_scale << "\n";
    file << "tilt_full_scale_deg " << tilt_full_scale_deg << "\n";
    file << "hand_y_bottom " << hand_y_bottom << "\n";
    file << "hand_y_top " << hand_y_top << "\n";
    file << "\n# Melody\n";
    file << "note_duration_max " << note_duration_max << "\n";
    file << "note_duration_min " << note_duration_min << "\n";
    file << "note_velocity_min " << note_velocity_min << "\n";
    file << "\n# Harmony and expression\n";
    file << "moderate_tilt_threshold " << moderate_tilt_threshold << "\n";
    file << "extreme_tilt_threshold " << extreme_tilt_threshold << "\n";
    file << "chord_bend_range " << chord_bend_range << "\n";
    file << "melody_bend_range " << melody_bend_range << "\n";
    file << "elbow_deadzone " << elbow_deadzone << "\n";
    file << "vibrato_rate_threshold " << vibrato_rate_threshold << "\n";
    file << "vibrato_window " << vibrato_window << "\n";
    file << "vibrato_min_reversals " << vibrato_min_reversals << "\n";
    file << "\n# Input\n";
    file << "require_full_frame " << require_full_frame << "\n";
    file << "verbose " << verbose << "\n";
}

} // namespace cuerpo
