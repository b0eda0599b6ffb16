#pragma once

#include <array>
#include <cstddef>
#include <string>

namespace cuerpo {

// Named features produced once per frame
enum class Feature {
    FeetCenterX,
    HipTilt,
    KneeAngle,
    RightHandY,
    LeftHandY,
    RightHandJerk,
    LeftHandJerk,
    RightArmVelocity,
    LeftArmVelocity,
    RightElbowHipAngle,
    LeftElbowHipAngle,
    HeadTilt,
    // Whole-body features
    Energy,
    Symmetry,
    Smoothness,
    ArmAngle,
    VerticalExtension
};

constexpr std::size_t kFeatureCount = 17;

struct FeatureDescriptor {
    Feature id;
    const char* name;      // Address suffix on the parameter stream
    float min_value;
    float max_value;
    float neutral_value;   // Reported before any measurement exists
};

const std::array<FeatureDescriptor, kFeatureCount>& feature_descriptors();

const FeatureDescriptor& descriptor(Feature f);
const char* feature_name(Feature f);

// Returns false when name is not a known feature
bool feature_from_name(const std::string& name, Feature& out);

inline std::size_t feature_index(Feature f) {
    return static_cast<std::size_t>(f);
}

// Clamp value into the declared range of f
float clamp_to_range(Feature f, float value);

// Immutable snapshot of every feature for one frame
class FeatureVector {
public:
    using Values = std::array<float, kFeatureCount>;

    // Values are clamped into their declared ranges
    FeatureVector(double timestamp, const Values& values);

    // Every feature at its neutral value
    static FeatureVector neutral(double timestamp);

    double timestamp() const { return timestamp_; }
    float get(Feature f) const { return values_[feature_index(f)]; }
    float operator[](Feature f) const { return get(f); }
    const Values& values() const { return values_; }

    // {"t": ..., "features": {"feetCenterX": ..., ...}}
    std::string to_json() const;

private:
    double timestamp_;
    Values values_;
};

} // namespace cuerpo
