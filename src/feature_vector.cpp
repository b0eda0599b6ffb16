#include "cuerpo/feature_vector.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

namespace cuerpo {

namespace {

const std::array<FeatureDescriptor, kFeatureCount> kDescriptors {{
    {Feature::FeetCenterX, "feetCenterX", 0.0f, 1.0f, 0.5f},
    {Feature::HipTilt, "hipTilt", -1.0f, 1.0f, 0.0f},
    {Feature::KneeAngle, "kneeAngle", 0.0f, 1.0f, 1.0f},
    {Feature::RightHandY, "rightHandY", 0.0f, 1.0f, 0.5f},
    {Feature::LeftHandY, "leftHandY", 0.0f, 1.0f, 0.5f},
    {Feature::RightHandJerk, "rightHandJerk", 0.0f, 1.0f, 0.0f},
    {Feature::LeftHandJerk, "leftHandJerk", 0.0f, 1.0f, 0.0f},
    {Feature::RightArmVelocity, "rightArmVelocity", 0.0f, 1.0f, 0.0f},
    {Feature::LeftArmVelocity, "leftArmVelocity", 0.0f, 1.0f, 0.0f},
    {Feature::RightElbowHipAngle, "rightElbowHipAngle", 0.0f, 1.0f, 0.0f},
    {Feature::LeftElbowHipAngle, "leftElbowHipAngle", 0.0f, 1.0f, 0.0f},
    {Feature::HeadTilt, "headTilt", -1.0f, 1.0f, 0.0f},
    {Feature::Energy, "energy", 0.0f, 1.0f, 0.0f},
    {Feature::Symmetry, "symmetry", -1.0f, 1.0f, 0.0f},
    {Feature::Smoothness, "smoothness", 0.0f, 1.0f, 0.5f},
    {Feature::ArmAngle, "armAngle", 0.0f, 1.0f, 0.0f},
    {Feature::VerticalExtension, "verticalExtension", 0.0f, 1.0f, 0.5f}
}};

} // namespace

const std::array<FeatureDescriptor, kFeatureCount>& feature_descriptors() {
    return kDescriptors;
}

const FeatureDescriptor& descriptor(Feature f) {
    return kDescriptors[feature_index(f)];
}

const char* feature_name(Feature f) {
    return descriptor(f).name;
}

bool feature_from_name(const std::string& name, Feature& out) {
    for (const auto& d : kDescriptors) {
        if (name == d.name) {
            out = d.id;
            return true;
        }
    }
    return false;
}

float clamp_to_range(Feature f, float value) {
    const auto& d = descriptor(f);
    // NaN never reaches the output
    if (!std::isfinite(value)) return d.neutral_value;
    return std::max(d.min_value, std::min(d.max_value, value));
}

FeatureVector::FeatureVector(double timestamp, const Values& values)
    : timestamp_(timestamp), values_(values) {
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        values_[i] = clamp_to_range(kDescriptors[i].id, values_[i]);
    }
}

FeatureVector FeatureVector::neutral(double timestamp) {
    Values values{};
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        values[i] = kDescriptors[i].neutral_value;
    }
    return FeatureVector(timestamp, values);
}

std::string FeatureVector::to_json() const {
    using json = nlohmann::json;
    json j;
    j["t"] = timestamp_;
    j["features"] = json::object();
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        j["features"][kDescriptors[i].name] = values_[i];
    }
    return j.dump();
}

} // namespace cuerpo
