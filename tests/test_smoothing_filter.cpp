#include <gtest/gtest.h>
#include "cuerpo/smoothing_filter.hpp"

#include <cmath>

using namespace cuerpo;

namespace {
std::array<float, kFeatureCount> uniform_alphas(float alpha) {
    std::array<float, kFeatureCount> a{};
    a.fill(alpha);
    return a;
}
}

// Test that the first sample initializes to the raw value (no ramp from zero)
TEST(SmoothingFilterTest, FirstSamplePassesThrough) {
    SmoothingFilter filter(uniform_alphas(0.2f));
    EXPECT_FLOAT_EQ(filter.apply(Feature::HipTilt, 0.8f), 0.8f);
    EXPECT_TRUE(filter.has_value(Feature::HipTilt));
}

// Test the EMA recurrence
TEST(SmoothingFilterTest, ExponentialAverage) {
    SmoothingFilter filter(uniform_alphas(0.25f));
    filter.apply(Feature::KneeAngle, 0.0f);
    EXPECT_FLOAT_EQ(filter.apply(Feature::KneeAngle, 1.0f), 0.25f);
    EXPECT_FLOAT_EQ(filter.apply(Feature::KneeAngle, 1.0f), 0.4375f);
}

// Test that features are smoothed independently with their own alpha
TEST(SmoothingFilterTest, PerFeatureAlpha) {
    auto alphas = uniform_alphas(0.5f);
    alphas[feature_index(Feature::RightHandJerk)] = 1.0f;
    SmoothingFilter filter(alphas);

    filter.apply(Feature::RightHandJerk, 0.0f);
    filter.apply(Feature::HeadTilt, 0.0f);
    EXPECT_FLOAT_EQ(filter.apply(Feature::RightHandJerk, 0.9f), 0.9f);
    EXPECT_FLOAT_EQ(filter.apply(Feature::HeadTilt, 0.9f), 0.45f);
}

// Test the neutral value before any sample
TEST(SmoothingFilterTest, ValueBeforeFirstSampleIsNeutral) {
    SmoothingFilter filter(uniform_alphas(0.5f));
    EXPECT_FALSE(filter.has_value(Feature::KneeAngle));
    EXPECT_FLOAT_EQ(filter.value(Feature::KneeAngle), 1.0f);
    EXPECT_FLOAT_EQ(filter.value(Feature::FeetCenterX), 0.5f);
}

// Test convergence of a held step within the predicted number of frames
TEST(SmoothingFilterTest, StepConvergesWithinPredictedFrames) {
    const float eps = 0.01f;
    for (float alpha : {0.1f, 0.3f, 0.5f, 0.9f}) {
        SmoothingFilter filter(uniform_alphas(alpha));
        filter.apply(Feature::ArmAngle, 0.0f);

        int k = SmoothingFilter::frames_to_converge(alpha, eps);
        ASSERT_GT(k, 0);
        float v = 0.0f;
        for (int i = 0; i < k; ++i) v = filter.apply(Feature::ArmAngle, 1.0f);
        EXPECT_LE(std::fabs(1.0f - v), eps * 1.001f) << "alpha=" << alpha;
    }
}

// Test that fewer frames than predicted are not yet converged
TEST(SmoothingFilterTest, ConvergenceBoundIsTight) {
    const float alpha = 0.2f;
    const float eps = 0.05f;
    SmoothingFilter filter(uniform_alphas(alpha));
    filter.apply(Feature::ArmAngle, 0.0f);

    int k = SmoothingFilter::frames_to_converge(alpha, eps);
    float v = 0.0f;
    for (int i = 0; i < k - 1; ++i) v = filter.apply(Feature::ArmAngle, 1.0f);
    EXPECT_GT(std::fabs(1.0f - v), eps);
}

// Test reset at session start
TEST(SmoothingFilterTest, ResetForgetsState) {
    SmoothingFilter filter(uniform_alphas(0.5f));
    filter.apply(Feature::Energy, 0.7f);
    filter.reset();
    EXPECT_FALSE(filter.has_value(Feature::Energy));
    EXPECT_FLOAT_EQ(filter.apply(Feature::Energy, 0.3f), 0.3f);
}
