#include "cuerpo/synthetic_pose.hpp"

#include <array>
#include <cmath>

namespace cuerpo {

namespace {

constexpr float kDegToRad = 3.14159265358979f / 180.0f;

// Neutral figure centred at x = 0.5, y grows downwards
const std::array<Vec2, kPoseLandmarkCount> kRestPose {{
    {0.50f, 0.15f},                                    // 0 nose
    {0.51f, 0.13f}, {0.52f, 0.13f}, {0.53f, 0.13f},    // 1-3 left eye
    {0.49f, 0.13f}, {0.48f, 0.13f}, {0.47f, 0.13f},    // 4-6 right eye
    {0.54f, 0.14f}, {0.46f, 0.14f},                    // 7-8 ears
    {0.51f, 0.18f}, {0.49f, 0.18f},                    // 9-10 mouth
    {0.58f, 0.30f}, {0.42f, 0.30f},                    // 11-12 shoulders
    {0.60f, 0.42f}, {0.40f, 0.42f},                    // 13-14 elbows
    {0.60f, 0.55f}, {0.40f, 0.55f},                    // 15-16 wrists
    {0.61f, 0.58f}, {0.39f, 0.58f},                    // 17-18 pinkies
    {0.60f, 0.59f}, {0.40f, 0.59f},                    // 19-20 index fingers
    {0.59f, 0.57f}, {0.41f, 0.57f},                    // 21-22 thumbs
    {0.55f, 0.55f}, {0.45f, 0.55f},                    // 23-24 hips
    {0.55f, 0.72f}, {0.45f, 0.72f},                    // 25-26 knees
    {0.55f, 0.90f}, {0.45f, 0.90f},                    // 27-28 ankles
    {0.56f, 0.92f}, {0.44f, 0.92f},                    // 29-30 heels
    {0.54f, 0.94f}, {0.46f, 0.94f}                     // 31-32 foot index
}};

// Rotate a left/right pair about its midpoint
void tilt_pair(std::array<Vec2, kPoseLandmarkCount>& pts, int left, int right, float degrees) {
    float mid_x = (pts[left].x + pts[right].x) / 2.0f;
    float mid_y = (pts[left].y + pts[right].y) / 2.0f;
    float half = std::fabs(pts[left].x - pts[right].x) / 2.0f;
    float dx = half * std::cos(degrees * kDegToRad);
    float dy = half * std::sin(degrees * kDegToRad);
    bool left_is_right_of_mid = pts[left].x > pts[right].x;
    pts[left] = Vec2(mid_x + (left_is_right_of_mid ? dx : -dx), mid_y - dy);
    pts[right] = Vec2(mid_x + (left_is_right_of_mid ? -dx : dx), mid_y + dy);
}

} // namespace

LandmarkFrame make_pose_frame(double timestamp, const PoseParams& params) {
    using namespace landmarks;
    auto pts = kRestPose;

    tilt_pair(pts, kLeftHip, kRightHip, params.hip_tilt_deg);
    tilt_pair(pts, kLeftEar, kRightEar, params.head_tilt_deg);

    // Knees move outwards as the legs bend
    float spread = params.knee_bend * 0.1f;
    pts[kLeftKnee].x += spread;
    pts[kRightKnee].x -= spread;

    float shift = params.center_x - 0.5f;
    LandmarkFrame frame;
    frame.timestamp = timestamp;
    frame.landmarks.reserve(kPoseLandmarkCount);
    for (int id = 0; id < kPoseLandmarkCount; ++id) {
        Vec2 p(pts[id].x + shift, pts[id].y);
        if (id == kRightWrist) p = params.right_wrist;
        if (id == kLeftWrist) p = params.left_wrist;
        frame.landmarks.emplace_back(id, p.x, p.y, 0.0f, params.visibility);
    }
    return frame;
}

} // namespace cuerpo
