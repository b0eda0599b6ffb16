#pragma once

#include "cuerpo/feature_vector.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cuerpo {

// Named constants shared by the pipeline stages
namespace constants {
    constexpr int kMinBufferCapacity = 3;
    constexpr int kZoneCount = 4;
    constexpr float kZoneWidth = 1.0f / kZoneCount;
    constexpr int kMidiMaxVelocity = 127;
    constexpr float kChordVelocityMin = 40.0f;
    constexpr float kChordVelocitySpan = 87.0f;
} // namespace constants

// Tunables for one performance session
struct SessionConfig {
    // Performer-tuned values, no defaults; a session refuses to start without them
    std::optional<float> hysteresis_margin;      // Overshoot past a zone boundary (< zone width / 2)
    std::optional<float> jerk_onset_threshold;   // Normalized jerk that arms a trigger
    std::optional<float> min_retrigger_interval; // Seconds between release and next onset
    std::optional<float> alpha_default;          // EMA alpha for features without an override
    std::map<std::string, float> alpha_overrides; // Keyed by feature name

    // Landmark history
    int buffer_capacity{4};           // Samples kept per landmark
    float visibility_threshold{0.5f}; // Below this a sample is treated as missing
    float gap_tolerance{0.25f};       // Seconds; longer gaps restart a landmark's history

    // Feature normalization
    float velocity_scale{2.0f};       // Wrist speed (units/s) mapped to 1.0
    float jerk_scale{40.0f};          // Velocity change rate mapped to 1.0
    float energy_scale{5.0f};         // Summed key-point speed mapped to 1.0
    float tilt_full_scale_deg{30.0f}; // Tilt angle mapped to +-1.0
    float hand_y_bottom{0.7f};        // Wrist y reported as handY 0.0
    float hand_y_top{0.1f};           // Wrist y reported as handY 1.0

    // Melody notes
    float note_duration_max{0.30f};   // Seconds held at zero arm velocity
    float note_duration_min{0.15f};   // Seconds held at full arm velocity
    int note_velocity_min{60};        // MIDI velocity at zero arm velocity

    // Harmony and expression
    float moderate_tilt_threshold{0.5f}; // Chord bend saturates here
    float extreme_tilt_threshold{0.6f};  // Extension note above this
    float chord_bend_range{0.5f};        // Chord bend at saturation (+-1 = full wheel)
    float melody_bend_range{0.25f};      // Melody bend at full elbow angle
    float elbow_deadzone{0.1f};          // Elbow angle with no bend
    float vibrato_rate_threshold{1.5f};  // Elbow angle rate (1/s) that counts as a swing
    int vibrato_window{6};               // Frames inspected for swings
    int vibrato_min_reversals{2};        // Direction changes that make a vibrato

    // Input checking
    bool require_full_frame{true};    // Reject frames without all 33 landmarks
    bool verbose{false};              // Enable verbose logging

    // Alpha used by the smoothing stage for f
    float alpha_for(Feature f) const;

    // Load from key/value file; returns false on I/O failure or invalid result
    [[nodiscard]] bool load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;

    // Validation; every violation is appended to errors when given
    [[nodiscard]] bool validate(std::vector<std::string>* errors = nullptr) const;
};

} // namespace cuerpo
