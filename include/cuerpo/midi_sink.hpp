#pragma once

#include "cuerpo/control_message.hpp"
#include "cuerpo/output_sink.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace cuerpo {

namespace midi {

constexpr int kMasterChannel = 0;     // Channel 1, MPE lower zone manager
constexpr int kMaxMemberChannels = 15;

constexpr int kCcModulation = 1;      // Vibrato depth
constexpr int kCcExpression = 11;
constexpr int kCcTimbre = 71;         // Texture
constexpr int kCcBrightness = 74;     // Filter
constexpr int kCcAllNotesOff = 123;

// Channel voice messages; channel is 0-based
std::vector<uint8_t> note_on(int channel, int pitch, int velocity);
std::vector<uint8_t> note_off(int channel, int pitch);
std::vector<uint8_t> control_change(int channel, int controller, int value);
std::vector<uint8_t> pitch_bend(int channel, float bend);

// [-1, 1] -> 14-bit wheel position, 8192 = centre
int bend_to_14bit(float bend);

// [0, 1] -> 0..127
int unit_to_7bit(float value);

// [-1, 1] -> 0..127 with 64 at the centre
int bipolar_to_7bit(float value);

// MPE configuration (RPN 6) declaring a lower zone with member_channels channels
std::vector<uint8_t> mpe_configuration(int member_channels);

} // namespace midi

struct MidiSinkConfig {
    std::string device_path;    // e.g. /dev/snd/midiC1D0
    int member_channels{midi::kMaxMemberChannels};
    bool verbose{false};
};

// MPE note and control stream written as raw MIDI bytes
class MidiSink : public OutputSink {
public:
    explicit MidiSink(const MidiSinkConfig& config);
    ~MidiSink() override;

    MidiSink(const MidiSink&) = delete;
    MidiSink& operator=(const MidiSink&) = delete;

    // Open the configured device path without blocking and send the MPE configuration
    [[nodiscard]] bool open();

    // Use an already open descriptor (a pipe or sequencer handle)
    [[nodiscard]] bool open_fd(int fd, bool take_ownership);

    // All notes off on every channel, then release the descriptor
    void close();
    bool is_open() const { return fd_ >= 0; }

    bool send_parameter(const std::string& name, float value) override;
    bool send_note_on(int voice, int pitch, int velocity) override;
    bool send_note_off(int voice) override;
    bool send_control_change(const std::string& name, float value, int voice) override;
    std::string name() const override;

    // 0-based member channel currently bound to voice, -1 when none
    int channel_of(int voice) const;

    const std::string& last_error() const { return last_error_; }

private:
    struct ChannelSlot {
        int voice{-1};
        int pitch{0};
        uint64_t age{0};   // Allocation counter at note-on
    };

    bool write_bytes(const std::vector<uint8_t>& bytes);
    bool configure();
    std::size_t pick_slot(int voice, bool& steal) const;

    MidiSinkConfig config_;
    int fd_{-1};
    bool owns_fd_{false};
    std::vector<ChannelSlot> slots_;   // slots_[i] is channel i + 1
    uint64_t allocations_{0};
    std::string last_error_;
};

} // namespace cuerpo
