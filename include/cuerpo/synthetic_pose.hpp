#pragma once

#include "cuerpo/pose_types.hpp"

namespace cuerpo {

// Controls of a synthetic standing figure
struct PoseParams {
    float center_x{0.5f};       // Horizontal shift of the whole body (feet midpoint)
    float hip_tilt_deg{0.0f};   // Positive lowers the right hip
    float head_tilt_deg{0.0f};  // Positive lowers the right ear
    float knee_bend{0.0f};      // 0 = straight legs, 1 = deep bend
    Vec2 right_wrist{0.4f, 0.55f};
    Vec2 left_wrist{0.6f, 0.55f};
    float visibility{0.99f};
};

// Full 33-landmark frame of the figure described by params (wrists are absolute)
LandmarkFrame make_pose_frame(double timestamp, const PoseParams& params);

} // namespace cuerpo
