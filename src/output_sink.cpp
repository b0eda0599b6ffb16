#include "cuerpo/output_sink.hpp"

namespace cuerpo {

const char* kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::ParameterUpdate: return "parameter";
        case MessageKind::NoteOn: return "note_on";
        case MessageKind::NoteOff: return "note_off";
        case MessageKind::ControlChange: return "control_change";
    }
    return "unknown";
}

bool deliver(OutputSink& sink, const ControlMessage& msg) {
    switch (msg.kind) {
        case MessageKind::ParameterUpdate:
            return sink.send_parameter(msg.name, msg.value);
        case MessageKind::NoteOn:
            return sink.send_note_on(msg.voice, msg.pitch, msg.velocity);
        case MessageKind::NoteOff:
            return sink.send_note_off(msg.voice);
        case MessageKind::ControlChange:
            return sink.send_control_change(msg.name, msg.value, msg.voice);
    }
    return false;
}

} // namespace cuerpo
