#pragma once

#include "cuerpo/control_message.hpp"
#include "cuerpo/feature_vector.hpp"
#include "cuerpo/gesture_trigger.hpp"
#include "cuerpo/session_config.hpp"
#include "cuerpo/zone_classifier.hpp"

#include <array>
#include <deque>

namespace cuerpo {

// Trigger output of both limbs for one frame
struct LimbEvents {
    TriggerEvent right;
    TriggerEvent left;
};

// Combines zone, trigger events and features into ordered control messages
class Mapper {
public:
    explicit Mapper(const SessionConfig& config);

    // Appends chord messages, then notes, then continuous controls
    void map(const FeatureVector& features, const ZoneResult& zone,
             const LimbEvents& events, MessageBatch& out);

    MessageBatch map(const FeatureVector& features, const ZoneResult& zone,
                     const LimbEvents& events);

    // NoteOff for every sounding voice; the next frame re-sends the chord
    void release_all(MessageBatch& out);

    void reset();

    bool chord_sounding() const { return chord_sounding_; }
    const std::array<int, voices::kChordCount>& chord_notes() const { return chord_notes_; }
    bool extension_sounding() const { return extension_on_; }
    int extension_pitch() const { return extension_pitch_; }
    bool melody_sounding(Limb limb) const { return melody_[slot(limb)].sounding; }
    int melody_pitch(Limb limb) const { return melody_[slot(limb)].pitch; }

private:
    struct MelodyVoice {
        int voice;
        int base_note;
        Feature elbow_feature;
        bool sounding{false};
        int pitch{0};
        bool vibrato_active{false};
        // Elbow angle tracking for vibrato detection
        bool has_angle{false};
        float prev_angle{0.0f};
        double prev_t{0.0};
        std::deque<int> swing_signs;
    };

    static std::size_t slot(Limb limb) { return limb == Limb::Right ? 0 : 1; }

    void map_chord(const FeatureVector& features, const ZoneResult& zone, MessageBatch& out);
    void map_extension(const FeatureVector& features, bool chord_changed, MessageBatch& out);
    void map_melody_notes(MelodyVoice& m, const TriggerEvent& ev, MessageBatch& out);
    void track_elbow(MelodyVoice& m, const FeatureVector& features);
    float vibrato_depth(const MelodyVoice& m) const;
    void map_continuous(const FeatureVector& features, MessageBatch& out);
    int chord_velocity(const FeatureVector& features) const;

    SessionConfig config_;

    bool chord_sounding_{false};
    int zone_{-1};
    std::array<int, voices::kChordCount> chord_notes_{};

    bool extension_on_{false};
    int extension_pitch_{0};
    int extension_side_{0};   // +1 seventh (right tilt), -1 sixth (left tilt)

    std::array<MelodyVoice, 2> melody_;
};

} // namespace cuerpo
