#pragma once

#include "cuerpo/control_message.hpp"

#include <string>

namespace cuerpo {

// Destination of control messages; sends return false when the message was not delivered
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual bool send_parameter(const std::string& name, float value) = 0;
    virtual bool send_note_on(int voice, int pitch, int velocity) = 0;
    virtual bool send_note_off(int voice) = 0;
    virtual bool send_control_change(const std::string& name, float value, int voice) = 0;

    // End of one frame's messages
    virtual bool flush() { return true; }

    virtual std::string name() const = 0;
};

// Route msg to the matching send_* call
bool deliver(OutputSink& sink, const ControlMessage& msg);

} // namespace cuerpo
