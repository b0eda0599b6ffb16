#pragma once

#include "cuerpo/pose_types.hpp"
#include "cuerpo/session_config.hpp"

#include <vector>

// Complete configuration with smoothing disabled so tests see raw values
inline cuerpo::SessionConfig make_test_config() {
    cuerpo::SessionConfig config;
    config.hysteresis_margin = 0.05f;
    config.jerk_onset_threshold = 0.5f;
    config.min_retrigger_interval = 0.2f;
    config.alpha_default = 1.0f;
    return config;
}

// Frame carrying only the given landmarks
inline cuerpo::LandmarkFrame make_frame(double t, const std::vector<cuerpo::Landmark>& landmarks) {
    cuerpo::LandmarkFrame frame;
    frame.timestamp = t;
    frame.landmarks = landmarks;
    return frame;
}
