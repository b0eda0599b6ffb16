#include "cuerpo/mapper.hpp"
#include "cuerpo/music_theory.hpp"

#include <algorithm>
#include <cmath>

namespace cuerpo {

namespace {

int sign_of(float v) {
    return v > 0.0f ? 1 : (v < 0.0f ? -1 : 0);
}

} // namespace

Mapper::Mapper(const SessionConfig& config)
    : config_(config) {
    melody_[0].voice = voices::kMelodyRight;
    melody_[0].base_note = music::kMelodyRightBase;
    melody_[0].elbow_feature = Feature::RightElbowHipAngle;
    melody_[1].voice = voices::kMelodyLeft;
    melody_[1].base_note = music::kMelodyLeftBase;
    melody_[1].elbow_feature = Feature::LeftElbowHipAngle;
}

MessageBatch Mapper::map(const FeatureVector& features, const ZoneResult& zone,
                         const LimbEvents& events) {
    MessageBatch out;
    map(features, zone, events, out);
    return out;
}

void Mapper::map(const FeatureVector& features, const ZoneResult& zone,
                 const LimbEvents& events, MessageBatch& out) {
    bool chord_changed = zone.changed || !chord_sounding_;

    // Harmonic context first
    if (chord_changed) map_chord(features, zone, out);

    // Notes
    map_extension(features, chord_changed, out);
    map_melody_notes(melody_[slot(Limb::Right)], events.right, out);
    map_melody_notes(melody_[slot(Limb::Left)], events.left, out);

    // Continuous controls
    for (auto& m : melody_) track_elbow(m, features);
    map_continuous(features, out);
}

int Mapper::chord_velocity(const FeatureVector& features) const {
    float v = constants::kChordVelocityMin +
              features[Feature::KneeAngle] * constants::kChordVelocitySpan;
    return std::max(1, std::min(constants::kMidiMaxVelocity, static_cast<int>(std::lround(v))));
}

void Mapper::map_chord(const FeatureVector& features, const ZoneResult& zone, MessageBatch& out) {
    out.push_back(ControlMessage::control_change("chord", static_cast<float>(zone.zone)));

    if (chord_sounding_) {
        for (int i = 0; i < voices::kChordCount; ++i) {
            out.push_back(ControlMessage::note_off(voices::kChordFirst + i));
        }
    }

    zone_ = zone.zone;
    chord_notes_ = music::triad(ZoneClassifier::chord_root_degree(zone_));
    int velocity = chord_velocity(features);
    for (int i = 0; i < voices::kChordCount; ++i) {
        out.push_back(ControlMessage::note_on(voices::kChordFirst + i, chord_notes_[i], velocity));
    }
    chord_sounding_ = true;
}

void Mapper::map_extension(const FeatureVector& features, bool chord_changed, MessageBatch& out) {
    float tilt = features[Feature::HipTilt];
    bool extreme = std::fabs(tilt) > config_.extreme_tilt_threshold;
    int side = sign_of(tilt);

    if (extension_on_ && (!extreme || side != extension_side_ || chord_changed)) {
        out.push_back(ControlMessage::note_off(voices::kExtension));
        extension_on_ = false;
    }
    if (extreme && !extension_on_) {
        int root = ZoneClassifier::chord_root_degree(zone_);
        extension_pitch_ = side > 0 ? music::seventh_of(root) : music::sixth_of(root);
        extension_side_ = side;
        extension_on_ = true;
        out.push_back(ControlMessage::note_on(voices::kExtension, extension_pitch_,
                                              chord_velocity(features)));
    }
}

void Mapper::map_melody_notes(MelodyVoice& m, const TriggerEvent& ev, MessageBatch& out) {
    if (ev.is_onset()) {
        // One voice per limb
        if (m.sounding) out.push_back(ControlMessage::note_off(m.voice));
        m.pitch = music::hand_y_to_note(ev.hand_y, m.base_note);
        m.sounding = true;
        out.push_back(ControlMessage::note_on(m.voice, m.pitch, ev.velocity));
    } else if (ev.is_release() && m.sounding) {
        m.sounding = false;
        out.push_back(ControlMessage::note_off(m.voice));
    }
}

void Mapper::track_elbow(MelodyVoice& m, const FeatureVector& features) {
    float angle = features[m.elbow_feature];
    double t = features.timestamp();
    if (m.has_angle && t > m.prev_t) {
        float rate = static_cast<float>((angle - m.prev_angle) / (t - m.prev_t));
        int swing = std::fabs(rate) > config_.vibrato_rate_threshold ? sign_of(rate) : 0;
        m.swing_signs.push_back(swing);
        while (static_cast<int>(m.swing_signs.size()) > config_.vibrato_window) {
            m.swing_signs.pop_front();
        }
    }
    m.has_angle = true;
    m.prev_angle = angle;
    m.prev_t = t;
}

float Mapper::vibrato_depth(const MelodyVoice& m) const {
    int reversals = 0;
    int last = 0;
    for (int s : m.swing_signs) {
        if (s == 0) continue;
        if (last != 0 && s != last) ++reversals;
        last = s;
    }
    if (reversals < config_.vibrato_min_reversals) return 0.0f;
    return std::min(1.0f, static_cast<float>(reversals) / (config_.vibrato_window - 1));
}

void Mapper::map_continuous(const FeatureVector& features, MessageBatch& out) {
    // Chord bend follows the hips, saturating at the moderate threshold
    float tilt = features[Feature::HipTilt];
    float magnitude = std::min(std::fabs(tilt), config_.moderate_tilt_threshold) /
                      config_.moderate_tilt_threshold;
    float chord_bend = sign_of(tilt) * magnitude * config_.chord_bend_range;
    for (int i = 0; i < voices::kChordCount; ++i) {
        out.push_back(ControlMessage::control_change("pitchBend", chord_bend, voices::kChordFirst + i));
    }
    if (extension_on_) {
        out.push_back(ControlMessage::control_change("pitchBend", chord_bend, voices::kExtension));
    }

    for (auto& m : melody_) {
        float depth = vibrato_depth(m);
        if (!m.sounding) {
            m.vibrato_active = false;
            continue;
        }
        float angle = features[m.elbow_feature];
        float bend = 0.0f;
        if (angle > config_.elbow_deadzone) {
            bend = (angle - config_.elbow_deadzone) / (1.0f - config_.elbow_deadzone) *
                   config_.melody_bend_range;
        }
        out.push_back(ControlMessage::control_change("pitchBend", bend, m.voice));
        if (depth > 0.0f || m.vibrato_active) {
            out.push_back(ControlMessage::control_change("vibrato", depth, m.voice));
        }
        m.vibrato_active = depth > 0.0f;
    }

    out.push_back(ControlMessage::control_change("expression", features[Feature::KneeAngle]));
    out.push_back(ControlMessage::control_change("filter", features[Feature::HeadTilt]));
    out.push_back(ControlMessage::control_change("texture", features[Feature::Energy]));

    for (const auto& d : feature_descriptors()) {
        out.push_back(ControlMessage::parameter(d.name, features[d.id]));
    }
}

void Mapper::release_all(MessageBatch& out) {
    for (auto& m : melody_) {
        if (m.sounding) out.push_back(ControlMessage::note_off(m.voice));
        m.sounding = false;
        m.vibrato_active = false;
    }
    if (extension_on_) out.push_back(ControlMessage::note_off(voices::kExtension));
    extension_on_ = false;
    if (chord_sounding_) {
        for (int i = 0; i < voices::kChordCount; ++i) {
            out.push_back(ControlMessage::note_off(voices::kChordFirst + i));
        }
    }
    chord_sounding_ = false;
}

void Mapper::reset() {
    chord_sounding_ = false;
    zone_ = -1;
    chord_notes_ = {};
    extension_on_ = false;
    extension_pitch_ = 0;
    extension_side_ = 0;
    for (auto& m : melody_) {
        m.sounding = false;
        m.pitch = 0;
        m.vibrato_active = false;
        m.has_angle = false;
        m.swing_signs.clear();
    }
}

} // namespace cuerpo
