#pragma once

#include "cuerpo/feature_vector.hpp"

#include <array>

namespace cuerpo {

// Per-feature exponential moving average
class SmoothingFilter {
public:
    explicit SmoothingFilter(const std::array<float, kFeatureCount>& alphas);

    // smoothed = alpha * raw + (1 - alpha) * previous; the first sample passes through
    float apply(Feature f, float raw);

    bool has_value(Feature f) const { return state_[feature_index(f)].initialized; }

    // Last smoothed value, or the neutral value before the first sample
    float value(Feature f) const;

    float alpha(Feature f) const { return state_[feature_index(f)].alpha; }

    void reset();

    // Frames of a held step needed to come within eps of the target
    static int frames_to_converge(float alpha, float eps);

private:
    struct State {
        float alpha{1.0f};
        float value{0.0f};
        bool initialized{false};
    };

    std::array<State, kFeatureCount> state_;
};

} // namespace cuerpo
