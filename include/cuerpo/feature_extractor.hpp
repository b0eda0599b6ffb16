#pragma once

#include "cuerpo/feature_vector.hpp"
#include "cuerpo/landmark_buffer.hpp"
#include "cuerpo/pose_types.hpp"
#include "cuerpo/session_config.hpp"
#include "cuerpo/smoothing_filter.hpp"

#include <optional>

namespace cuerpo {

// Turns one landmark frame into a smoothed, clamped feature vector
class FeatureExtractor {
public:
    explicit FeatureExtractor(const SessionConfig& config);

    // Features whose inputs are missing keep their last smoothed value
    FeatureVector extract(const LandmarkFrame& frame);

    // Forget history and smoothing state
    void reset();

    const LandmarkFrameBuffer& buffer() const { return buffer_; }
    const SmoothingFilter& smoothing() const { return smoothing_; }

private:
    // Raw measurement of f for the current frame; nullopt when inputs are unavailable
    std::optional<float> measure(Feature f, const LandmarkFrame& frame) const;

    // Landmark of frame usable for geometry, or nullptr
    const Landmark* usable(const LandmarkFrame& frame, int id) const;

    std::optional<float> tilt(const LandmarkFrame& frame, int left_id, int right_id) const;
    std::optional<float> knee_angle(const LandmarkFrame& frame) const;
    std::optional<float> elbow_hip_angle(const LandmarkFrame& frame, int shoulder_id,
                                         int elbow_id, int hip_id) const;
    std::optional<float> hand_y(const LandmarkFrame& frame, int wrist_id) const;
    std::optional<float> wrist_jerk(int wrist_id) const;
    std::optional<float> wrist_speed(int wrist_id) const;
    std::optional<float> energy() const;
    std::optional<float> symmetry(const LandmarkFrame& frame) const;
    std::optional<float> smoothness() const;
    std::optional<float> arm_angle(const LandmarkFrame& frame) const;
    std::optional<float> vertical_extension(const LandmarkFrame& frame) const;

    SessionConfig config_;
    LandmarkFrameBuffer buffer_;
    SmoothingFilter smoothing_;
};

// Angle at vertex b of triangle a-b-c in radians, nullopt when degenerate
std::optional<float> joint_angle(const Vec2& a, const Vec2& b, const Vec2& c);

} // namespace cuerpo
