#include "cuerpo/session.hpp"

#include <array>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace cuerpo {

namespace {

const SessionConfig& checked(const SessionConfig& config) {
    std::vector<std::string> errors;
    if (!config.validate(&errors)) {
        std::ostringstream oss;
        oss << "invalid session configuration:";
        for (const auto& e : errors) oss << "\n  " << e;
        throw std::invalid_argument(oss.str());
    }
    return config;
}

bool finite(float v) {
    return std::isfinite(v);
}

} // namespace

TriggerConfig Session::trigger_config(const SessionConfig& config) {
    TriggerConfig tc;
    tc.jerk_onset_threshold = *config.jerk_onset_threshold;
    tc.min_retrigger_interval = *config.min_retrigger_interval;
    tc.note_duration_max = config.note_duration_max;
    tc.note_duration_min = config.note_duration_min;
    tc.note_velocity_min = config.note_velocity_min;
    return tc;
}

Session::Session(const SessionConfig& config)
    : config_(checked(config)),
      extractor_(config_),
      classifier_(*config_.hysteresis_margin),
      right_(Limb::Right, trigger_config(config_)),
      left_(Limb::Left, trigger_config(config_)),
      mapper_(config_) {
    if (config_.verbose) {
        std::cerr << "[Session] Started (margin=" << *config_.hysteresis_margin
                  << ", jerk threshold=" << *config_.jerk_onset_threshold
                  << ", retrigger=" << *config_.min_retrigger_interval << "s)\n";
    }
}

bool Session::validate_frame(const LandmarkFrame& frame, std::string* reason) const {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (!std::isfinite(frame.timestamp)) return fail("non-finite timestamp");
    if (has_timestamp_ && !(frame.timestamp > last_timestamp_)) {
        return fail("timestamp not increasing");
    }
    if (frame.landmarks.size() > static_cast<std::size_t>(kPoseLandmarkCount)) {
        return fail("too many landmarks (" + std::to_string(frame.landmarks.size()) + ")");
    }
    if (config_.require_full_frame &&
        frame.landmarks.size() != static_cast<std::size_t>(kPoseLandmarkCount)) {
        return fail("expected 33 landmarks, got " + std::to_string(frame.landmarks.size()));
    }

    std::array<bool, kPoseLandmarkCount> seen{};
    for (const auto& lm : frame.landmarks) {
        if (lm.id < 0 || lm.id >= kPoseLandmarkCount) {
            return fail("landmark id out of range (" + std::to_string(lm.id) + ")");
        }
        if (seen[lm.id]) return fail("duplicate landmark id " + std::to_string(lm.id));
        seen[lm.id] = true;
        if (!finite(lm.x) || !finite(lm.y) || !finite(lm.z) || !finite(lm.visibility)) {
            return fail("non-finite value in landmark " + std::to_string(lm.id));
        }
        if (lm.visibility < 0.0f || lm.visibility > 1.0f) {
            return fail("visibility out of range in landmark " + std::to_string(lm.id));
        }
    }
    return true;
}

bool Session::process(const LandmarkFrame& frame, MessageBatch& out) {
    std::string reason;
    if (!validate_frame(frame, &reason)) {
        stats_.frames_rejected++;
        std::cerr << "[Session] Rejected frame at t=" << frame.timestamp << ": " << reason << "\n";
        return false;
    }
    has_timestamp_ = true;
    last_timestamp_ = frame.timestamp;

    FeatureVector features = extractor_.extract(frame);
    ZoneResult zone = classifier_.classify(features[Feature::FeetCenterX]);

    // Onsets need a wrist seen in this frame; held jerk never triggers
    const LandmarkFrameBuffer& buffer = extractor_.buffer();
    float right_jerk = buffer.is_current(landmarks::kRightWrist) ? features[Feature::RightHandJerk] : 0.0f;
    float left_jerk = buffer.is_current(landmarks::kLeftWrist) ? features[Feature::LeftHandJerk] : 0.0f;

    LimbEvents events;
    events.right = right_.update(frame.timestamp, right_jerk,
                                 features[Feature::RightArmVelocity], features[Feature::RightHandY]);
    events.left = left_.update(frame.timestamp, left_jerk,
                               features[Feature::LeftArmVelocity], features[Feature::LeftHandY]);

    std::size_t before = out.size();
    mapper_.map(features, zone, events, out);

    stats_.frames_processed++;
    stats_.messages_emitted += out.size() - before;
    if (zone.changed) {
        stats_.zone_changes++;
        if (config_.verbose) {
            std::cerr << "[Session] Zone " << zone.zone << " (" << ZoneClassifier::chord_name(zone.zone)
                      << ") at t=" << frame.timestamp << "\n";
        }
    }
    record_event(Limb::Right, events.right);
    record_event(Limb::Left, events.left);

    last_features_ = features;
    return true;
}

void Session::record_event(Limb limb, const TriggerEvent& ev) {
    if (ev.is_onset()) {
        stats_.onsets++;
    } else if (ev.is_release()) {
        stats_.releases++;
    } else {
        return;
    }
    if (config_.verbose) {
        std::cerr << "[Session] " << limb_name(limb) << (ev.is_onset() ? " onset" : " release")
                  << " at t=" << ev.timestamp;
        if (ev.is_onset()) std::cerr << " (vel: " << ev.velocity << ", dur: " << ev.duration << "s)";
        std::cerr << "\n";
    }
}

void Session::end(MessageBatch& out) {
    double t = has_timestamp_ ? last_timestamp_ : 0.0;
    for (auto* trigger : {&right_, &left_}) {
        if (trigger->force_release(t).is_release()) stats_.releases++;
    }

    std::size_t before = out.size();
    mapper_.release_all(out);
    stats_.messages_emitted += out.size() - before;

    if (config_.verbose) {
        std::cerr << "[Session] Ended after " << stats_.frames_processed << " frames ("
                  << stats_.frames_rejected << " rejected, " << stats_.onsets << " onsets)\n";
    }

    extractor_.reset();
    classifier_.reset();
    right_.reset();
    left_.reset();
    mapper_.reset();
    last_features_.reset();
    has_timestamp_ = false;
    last_timestamp_ = 0.0;
}

TriggerPhase Session::phase(Limb limb) const {
    return limb == Limb::Right ? right_.phase() : left_.phase();
}

} // namespace cuerpo
