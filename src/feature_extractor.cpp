#include "cuerpo/feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace cuerpo {

namespace {

constexpr float kPi = 3.14159265358979f;
constexpr float kRadToDeg = 180.0f / kPi;
constexpr float kMinSegment = 1e-6f;
// Ankle-to-nose height of 2/3 of the image reads as fully extended
constexpr float kExtensionGain = 1.5f;

std::array<float, kFeatureCount> alphas_from(const SessionConfig& config) {
    std::array<float, kFeatureCount> alphas{};
    for (const auto& d : feature_descriptors()) {
        alphas[feature_index(d.id)] = config.alpha_for(d.id);
    }
    return alphas;
}

Vec2 pos(const Landmark& lm) {
    return Vec2(lm.x, lm.y);
}

float clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

} // namespace

std::optional<float> joint_angle(const Vec2& a, const Vec2& b, const Vec2& c) {
    float ab = (a - b).length();
    float cb = (c - b).length();
    float ac = (a - c).length();
    if (ab < kMinSegment || cb < kMinSegment) return std::nullopt;

    // Law of cosines at b
    float cos_b = (ab * ab + cb * cb - ac * ac) / (2.0f * ab * cb);
    cos_b = std::max(-1.0f, std::min(1.0f, cos_b));
    return std::acos(cos_b);
}

FeatureExtractor::FeatureExtractor(const SessionConfig& config)
    : config_(config),
      buffer_(config.buffer_capacity, config.visibility_threshold,
              config.gap_tolerance, config.jerk_scale),
      smoothing_(alphas_from(config)) {}

FeatureVector FeatureExtractor::extract(const LandmarkFrame& frame) {
    buffer_.push(frame);

    FeatureVector::Values values{};
    for (const auto& d : feature_descriptors()) {
        auto raw = measure(d.id, frame);
        if (raw) {
            values[feature_index(d.id)] = smoothing_.apply(d.id, clamp_to_range(d.id, *raw));
        } else {
            values[feature_index(d.id)] = smoothing_.value(d.id);
        }
    }
    return FeatureVector(frame.timestamp, values);
}

void FeatureExtractor::reset() {
    buffer_.clear();
    smoothing_.reset();
}

const Landmark* FeatureExtractor::usable(const LandmarkFrame& frame, int id) const {
    const Landmark* lm = frame.find(id);
    if (!lm || lm->visibility < config_.visibility_threshold) return nullptr;
    return lm;
}

std::optional<float> FeatureExtractor::measure(Feature f, const LandmarkFrame& frame) const {
    using namespace landmarks;
    switch (f) {
        case Feature::FeetCenterX: {
            const Landmark* l = usable(frame, kLeftAnkle);
            const Landmark* r = usable(frame, kRightAnkle);
            if (!l || !r) return std::nullopt;
            return (l->x + r->x) / 2.0f;
        }
        case Feature::HipTilt:
            return tilt(frame, kLeftHip, kRightHip);
        case Feature::KneeAngle:
            return knee_angle(frame);
        case Feature::RightHandY:
            return hand_y(frame, kRightWrist);
        case Feature::LeftHandY:
            return hand_y(frame, kLeftWrist);
        case Feature::RightHandJerk:
            return wrist_jerk(kRightWrist);
        case Feature::LeftHandJerk:
            return wrist_jerk(kLeftWrist);
        case Feature::RightArmVelocity:
            return wrist_speed(kRightWrist);
        case Feature::LeftArmVelocity:
            return wrist_speed(kLeftWrist);
        case Feature::RightElbowHipAngle:
            return elbow_hip_angle(frame, kRightShoulder, kRightElbow, kRightHip);
        case Feature::LeftElbowHipAngle:
            return elbow_hip_angle(frame, kLeftShoulder, kLeftElbow, kLeftHip);
        case Feature::HeadTilt:
            return tilt(frame, kLeftEar, kRightEar);
        case Feature::Energy:
            return energy();
        case Feature::Symmetry:
            return symmetry(frame);
        case Feature::Smoothness:
            return smoothness();
        case Feature::ArmAngle:
            return arm_angle(frame);
        case Feature::VerticalExtension:
            return vertical_extension(frame);
    }
    return std::nullopt;
}

std::optional<float> FeatureExtractor::tilt(const LandmarkFrame& frame, int left_id, int right_id) const {
    const Landmark* l = usable(frame, left_id);
    const Landmark* r = usable(frame, right_id);
    if (!l || !r) return std::nullopt;

    // Positive when the right point sits lower in the image
    float degrees = std::atan2(r->y - l->y, std::fabs(l->x - r->x)) * kRadToDeg;
    return degrees / config_.tilt_full_scale_deg;
}

std::optional<float> FeatureExtractor::knee_angle(const LandmarkFrame& frame) const {
    using namespace landmarks;
    const int legs[2][3] = {
        {kLeftHip, kLeftKnee, kLeftAnkle},
        {kRightHip, kRightKnee, kRightAnkle}
    };

    float sum = 0.0f;
    int count = 0;
    for (const auto& leg : legs) {
        const Landmark* hip = usable(frame, leg[0]);
        const Landmark* knee = usable(frame, leg[1]);
        const Landmark* ankle = usable(frame, leg[2]);
        if (!hip || !knee || !ankle) continue;
        auto angle = joint_angle(pos(*hip), pos(*knee), pos(*ankle));
        if (!angle) continue;
        sum += *angle / kPi;
        ++count;
    }
    if (count == 0) return std::nullopt;
    return sum / count;
}

std::optional<float> FeatureExtractor::elbow_hip_angle(const LandmarkFrame& frame, int shoulder_id,
                                                       int elbow_id, int hip_id) const {
    const Landmark* shoulder = usable(frame, shoulder_id);
    const Landmark* elbow = usable(frame, elbow_id);
    const Landmark* hip = usable(frame, hip_id);
    if (!shoulder || !elbow || !hip) return std::nullopt;

    auto angle = joint_angle(pos(*elbow), pos(*shoulder), pos(*hip));
    if (!angle) return std::nullopt;
    return *angle / kPi;
}

std::optional<float> FeatureExtractor::hand_y(const LandmarkFrame& frame, int wrist_id) const {
    const Landmark* wrist = usable(frame, wrist_id);
    if (!wrist) return std::nullopt;
    return (config_.hand_y_bottom - wrist->y) / (config_.hand_y_bottom - config_.hand_y_top);
}

// Derivatives of a lost wrist are measured as zero so held values decay
std::optional<float> FeatureExtractor::wrist_jerk(int wrist_id) const {
    if (buffer_.is_lost(wrist_id)) return 0.0f;
    if (!buffer_.is_current(wrist_id)) return std::nullopt;
    return buffer_.jerk(wrist_id);
}

std::optional<float> FeatureExtractor::wrist_speed(int wrist_id) const {
    if (buffer_.is_lost(wrist_id)) return 0.0f;
    if (!buffer_.is_current(wrist_id)) return std::nullopt;
    return buffer_.velocity(wrist_id).speed / config_.velocity_scale;
}

std::optional<float> FeatureExtractor::energy() const {
    using namespace landmarks;
    const int key_points[] = {kNose, kLeftWrist, kRightWrist, kLeftAnkle, kRightAnkle};

    float total = 0.0f;
    bool any = false;
    for (int id : key_points) {
        if (buffer_.is_lost(id)) {
            any = true;
            continue;
        }
        if (!buffer_.is_current(id)) continue;
        total += buffer_.velocity(id).speed;
        any = true;
    }
    if (!any) return std::nullopt;
    return total / config_.energy_scale;
}

std::optional<float> FeatureExtractor::symmetry(const LandmarkFrame& frame) const {
    const Landmark* l = usable(frame, landmarks::kLeftWrist);
    const Landmark* r = usable(frame, landmarks::kRightWrist);
    if (!l || !r) return std::nullopt;

    // Positive when the right arm reaches further from the centre line
    float left_dev = 0.5f - l->x;
    float right_dev = r->x - 0.5f;
    return (right_dev - left_dev) * 2.0f;
}

std::optional<float> FeatureExtractor::smoothness() const {
    using namespace landmarks;
    float sum = 0.0f;
    int count = 0;
    for (int id : {kLeftWrist, kRightWrist}) {
        if (!buffer_.is_current(id) && !buffer_.is_lost(id)) continue;
        sum += buffer_.jerk(id);
        ++count;
    }
    if (count == 0) return std::nullopt;
    return 1.0f - sum / count;
}

std::optional<float> FeatureExtractor::arm_angle(const LandmarkFrame& frame) const {
    using namespace landmarks;
    const int arms[2][2] = {
        {kLeftShoulder, kLeftWrist},
        {kRightShoulder, kRightWrist}
    };

    float sum = 0.0f;
    int count = 0;
    for (const auto& arm : arms) {
        const Landmark* shoulder = usable(frame, arm[0]);
        const Landmark* wrist = usable(frame, arm[1]);
        if (!shoulder || !wrist) continue;
        // Raised wrist has the smaller y
        sum += clamp01(shoulder->y - wrist->y + 0.5f);
        ++count;
    }
    if (count == 0) return std::nullopt;
    return sum / count;
}

std::optional<float> FeatureExtractor::vertical_extension(const LandmarkFrame& frame) const {
    using namespace landmarks;
    const Landmark* nose = usable(frame, kNose);
    const Landmark* l = usable(frame, kLeftAnkle);
    const Landmark* r = usable(frame, kRightAnkle);
    if (!nose || !l || !r) return std::nullopt;

    float ankle_y = (l->y + r->y) / 2.0f;
    return (ankle_y - nose->y) * kExtensionGain;
}

} // namespace cuerpo
