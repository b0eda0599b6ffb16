#pragma once

#include <cstddef>
#include <vector>

namespace cuerpo {

// MediaPipe pose numbering (odd = left side of the body)
namespace landmarks {
    constexpr int kNose = 0;
    constexpr int kLeftEar = 7;
    constexpr int kRightEar = 8;
    constexpr int kLeftShoulder = 11;
    constexpr int kRightShoulder = 12;
    constexpr int kLeftElbow = 13;
    constexpr int kRightElbow = 14;
    constexpr int kLeftWrist = 15;
    constexpr int kRightWrist = 16;
    constexpr int kLeftHip = 23;
    constexpr int kRightHip = 24;
    constexpr int kLeftKnee = 25;
    constexpr int kRightKnee = 26;
    constexpr int kLeftAnkle = 27;
    constexpr int kRightAnkle = 28;
} // namespace landmarks

constexpr int kPoseLandmarkCount = 33;

// One detected body point
struct Landmark {
    int id;            // Landmark identifier (0-32)
    float x;           // Normalized horizontal position (0.0 = left of image)
    float y;           // Normalized vertical position (0.0 = top of image)
    float z;           // Depth relative to the hips, unbounded
    float visibility;  // Detector confidence (0.0 - 1.0)

    Landmark() : id(-1), x(0.0f), y(0.0f), z(0.0f), visibility(0.0f) {}
    Landmark(int id_, float x_, float y_, float z_ = 0.0f, float visibility_ = 1.0f)
        : id(id_), x(x_), y(y_), z(z_), visibility(visibility_) {}
};

// All landmarks of one captured image
struct LandmarkFrame {
    double timestamp;                // Seconds, strictly increasing within a session
    std::vector<Landmark> landmarks; // Keyed by Landmark::id, order irrelevant

    LandmarkFrame() : timestamp(0.0) {}

    // Returns nullptr when the frame carries no entry for id
    const Landmark* find(int id) const;
};

// Planar vector helper for the geometry code
struct Vec2 {
    float x;
    float y;

    Vec2() : x(0.0f), y(0.0f) {}
    Vec2(float x_, float y_) : x(x_), y(y_) {}

    float length() const;
};

inline Vec2 operator-(const Vec2& a, const Vec2& b) {
    return Vec2(a.x - b.x, a.y - b.y);
}

} // namespace cuerpo
