#pragma once

namespace cuerpo {

enum class TriggerPhase {
    Idle,
    Armed,
    Sounding
};

enum class Limb {
    Right,
    Left
};

const char* phase_name(TriggerPhase phase);
const char* limb_name(Limb limb);

struct TriggerEvent {
    enum class Type {
        None,
        Onset,
        Release
    };

    Type type{Type::None};
    int velocity{0};        // MIDI velocity of the onset
    float duration{0.0f};   // Seconds the note will sound
    float hand_y{0.0f};     // Hand height at the onset
    double timestamp{0.0};

    bool is_onset() const { return type == Type::Onset; }
    bool is_release() const { return type == Type::Release; }
};

struct TriggerConfig {
    float jerk_onset_threshold{0.5f};
    float min_retrigger_interval{0.2f};
    float note_duration_max{0.30f};
    float note_duration_min{0.15f};
    int note_velocity_min{60};
};

// Debounced onset detector for one limb
class GestureTrigger {
public:
    GestureTrigger(Limb limb, const TriggerConfig& config);

    // Single transition function; at most one event per call
    TriggerEvent update(double t, float jerk, float arm_velocity, float hand_y);

    // Ends a sounding note immediately (session end)
    TriggerEvent force_release(double t);

    void reset();

    Limb limb() const { return limb_; }
    TriggerPhase phase() const { return phase_; }
    bool is_sounding() const { return phase_ == TriggerPhase::Sounding; }
    double last_onset() const { return last_onset_; }
    double cooldown_deadline() const { return cooldown_deadline_; }
    int current_velocity() const { return velocity_; }
    float current_duration() const { return duration_; }

private:
    TriggerEvent release(double t);

    Limb limb_;
    TriggerConfig config_;
    TriggerPhase phase_{TriggerPhase::Idle};
    double last_onset_{0.0};
    double cooldown_deadline_{0.0};
    bool has_deadline_{false};
    int velocity_{0};
    float duration_{0.0f};
};

} // namespace cuerpo
