#include "cuerpo/gesture_trigger.hpp"

#include <algorithm>
#include <cmath>

namespace cuerpo {

const char* phase_name(TriggerPhase phase) {
    switch (phase) {
        case TriggerPhase::Idle: return "idle";
        case TriggerPhase::Armed: return "armed";
        case TriggerPhase::Sounding: return "sounding";
    }
    return "unknown";
}

const char* limb_name(Limb limb) {
    return limb == Limb::Right ? "right" : "left";
}

GestureTrigger::GestureTrigger(Limb limb, const TriggerConfig& config)
    : limb_(limb), config_(config) {}

TriggerEvent GestureTrigger::update(double t, float jerk, float arm_velocity, float hand_y) {
    switch (phase_) {
        case TriggerPhase::Idle: {
            bool cooled = !has_deadline_ || t >= cooldown_deadline_;
            if (!cooled || !(jerk > config_.jerk_onset_threshold)) {
                return TriggerEvent{};
            }
            // An armed limb sounds in the same frame
            phase_ = TriggerPhase::Armed;
        }
        // Fall through
        case TriggerPhase::Armed: {
            float v = std::max(0.0f, std::min(1.0f, arm_velocity));
            int span = 127 - config_.note_velocity_min;
            velocity_ = config_.note_velocity_min + static_cast<int>(std::lround(v * span));
            duration_ = config_.note_duration_max -
                        v * (config_.note_duration_max - config_.note_duration_min);
            last_onset_ = t;
            phase_ = TriggerPhase::Sounding;

            TriggerEvent ev;
            ev.type = TriggerEvent::Type::Onset;
            ev.velocity = velocity_;
            ev.duration = duration_;
            ev.hand_y = hand_y;
            ev.timestamp = t;
            return ev;
        }
        case TriggerPhase::Sounding:
            // Onsets while sounding are ignored
            if (t - last_onset_ >= duration_) return release(t);
            return TriggerEvent{};
    }
    return TriggerEvent{};
}

TriggerEvent GestureTrigger::force_release(double t) {
    if (phase_ != TriggerPhase::Sounding) return TriggerEvent{};
    return release(t);
}

TriggerEvent GestureTrigger::release(double t) {
    phase_ = TriggerPhase::Idle;
    cooldown_deadline_ = t + config_.min_retrigger_interval;
    has_deadline_ = true;

    TriggerEvent ev;
    ev.type = TriggerEvent::Type::Release;
    ev.velocity = velocity_;
    ev.duration = duration_;
    ev.timestamp = t;
    return ev;
}

void GestureTrigger::reset() {
    phase_ = TriggerPhase::Idle;
    last_onset_ = 0.0;
    cooldown_deadline_ = 0.0;
    has_deadline_ = false;
    velocity_ = 0;
    duration_ = 0.0f;
}

} // namespace cuerpo
