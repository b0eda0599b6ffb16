#include "cuerpo/pose_types.hpp"

#include <cmath>

namespace cuerpo {

const Landmark* LandmarkFrame::find(int id) const {
    for (const auto& lm : landmarks) {
        if (lm.id == id) return &lm;
    }
    return nullptr;
}

float Vec2::length() const {
    return std::sqrt(x * x + y * y);
}

} // namespace cuerpo
