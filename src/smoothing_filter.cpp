#include "cuerpo/smoothing_filter.hpp"

#include <cmath>

namespace cuerpo {

SmoothingFilter::SmoothingFilter(const std::array<float, kFeatureCount>& alphas) {
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        state_[i].alpha = alphas[i];
    }
}

float SmoothingFilter::apply(Feature f, float raw) {
    auto& s = state_[feature_index(f)];
    if (!s.initialized) {
        s.value = raw;
        s.initialized = true;
    } else {
        s.value = s.alpha * raw + (1.0f - s.alpha) * s.value;
    }
    return s.value;
}

float SmoothingFilter::value(Feature f) const {
    const auto& s = state_[feature_index(f)];
    return s.initialized ? s.value : descriptor(f).neutral_value;
}

void SmoothingFilter::reset() {
    for (auto& s : state_) {
        s.value = 0.0f;
        s.initialized = false;
    }
}

int SmoothingFilter::frames_to_converge(float alpha, float eps) {
    if (alpha >= 1.0f) return 1;
    if (alpha <= 0.0f || eps <= 0.0f || eps >= 1.0f) return -1;
    // Residual of a unit step after k frames is (1 - alpha)^k
    return static_cast<int>(std::ceil(std::log(eps) / std::log(1.0f - alpha)));
}

} // namespace cuerpo
