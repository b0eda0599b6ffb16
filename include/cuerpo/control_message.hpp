#pragma once

#include <string>
#include <vector>

namespace cuerpo {

enum class MessageKind {
    ParameterUpdate,
    NoteOn,
    NoteOff,
    ControlChange
};

// Voice numbers used by the mapper
namespace voices {
    constexpr int kGlobal = -1;
    constexpr int kChordFirst = 0;      // Chord root, third, fifth: 0-2
    constexpr int kChordCount = 3;
    constexpr int kExtension = 3;
    constexpr int kMelodyRight = 4;
    constexpr int kMelodyLeft = 5;
    constexpr int kCount = 6;
} // namespace voices

// One outbound musical control message
struct ControlMessage {
    MessageKind kind;
    std::string name;   // Feature or control name (ParameterUpdate, ControlChange)
    float value;        // Payload of ParameterUpdate / ControlChange
    int voice;          // -1 for global controls
    int pitch;          // NoteOn only
    int velocity;       // NoteOn only

    static ControlMessage parameter(const std::string& name, float value) {
        return ControlMessage{MessageKind::ParameterUpdate, name, value, voices::kGlobal, 0, 0};
    }
    static ControlMessage note_on(int voice, int pitch, int velocity) {
        return ControlMessage{MessageKind::NoteOn, std::string(), 0.0f, voice, pitch, velocity};
    }
    static ControlMessage note_off(int voice) {
        return ControlMessage{MessageKind::NoteOff, std::string(), 0.0f, voice, 0, 0};
    }
    static ControlMessage control_change(const std::string& name, float value,
                                         int voice = voices::kGlobal) {
        return ControlMessage{MessageKind::ControlChange, name, value, voice, 0, 0};
    }

    bool is_note() const {
        return kind == MessageKind::NoteOn || kind == MessageKind::NoteOff;
    }
};

using MessageBatch = std::vector<ControlMessage>;

const char* kind_name(MessageKind kind);

} // namespace cuerpo
