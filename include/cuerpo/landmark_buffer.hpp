#pragma once

#include "cuerpo/pose_types.hpp"

#include <array>
#include <cstddef>
#include <deque>

namespace cuerpo {

// One accepted observation of a landmark
struct LandmarkSample {
    double t;
    float x;
    float y;
};

// Finite-difference velocity in normalized units per second
struct Velocity {
    float vx{0.0f};
    float vy{0.0f};
    float speed{0.0f};
};

// Bounded rolling history per landmark id
class LandmarkFrameBuffer {
public:
    LandmarkFrameBuffer(int capacity, float visibility_threshold,
                        float gap_tolerance, float jerk_scale);

    // Append the valid samples of frame; low-visibility entries are skipped
    void push(const LandmarkFrame& frame);

    // Zero when fewer than two samples exist or the newest one is stale
    Velocity velocity(int id) const;

    // Velocity change rate over jerk_scale, clamped to [0, 1]
    float jerk(int id) const;

    // True when id has a valid sample in the most recent frame
    bool is_current(int id) const;

    // True when id was seen but its newest valid sample is older than the gap tolerance
    bool is_lost(int id) const;

    std::size_t sample_count(int id) const;
    double last_timestamp() const { return now_; }

    void clear();

private:
    bool is_stale(const std::deque<LandmarkSample>& h) const;

    std::size_t capacity_;
    float visibility_threshold_;
    double gap_tolerance_;
    float jerk_scale_;
    double now_{0.0};
    std::array<std::deque<LandmarkSample>, kPoseLandmarkCount> history_;
};

} // namespace cuerpo
