#include "cuerpo/midi_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <iostream>

namespace cuerpo {

namespace midi {

namespace {

uint8_t status(uint8_t kind, int channel) {
    return static_cast<uint8_t>(kind | (channel & 0x0F));
}

uint8_t data7(int v) {
    return static_cast<uint8_t>(std::max(0, std::min(127, v)));
}

} // namespace

std::vector<uint8_t> note_on(int channel, int pitch, int velocity) {
    return {status(0x90, channel), data7(pitch), data7(velocity)};
}

std::vector<uint8_t> note_off(int channel, int pitch) {
    return {status(0x80, channel), data7(pitch), 0};
}

std::vector<uint8_t> control_change(int channel, int controller, int value) {
    return {status(0xB0, channel), data7(controller), data7(value)};
}

int bend_to_14bit(float bend) {
    if (!std::isfinite(bend)) return 8192;
    int v = 8192 + static_cast<int>(std::lround(bend * 8191.0f));
    return std::max(0, std::min(16383, v));
}

std::vector<uint8_t> pitch_bend(int channel, float bend) {
    int v = bend_to_14bit(bend);
    return {status(0xE0, channel), static_cast<uint8_t>(v & 0x7F), static_cast<uint8_t>((v >> 7) & 0x7F)};
}

int unit_to_7bit(float value) {
    if (!std::isfinite(value)) return 0;
    return data7(static_cast<int>(std::lround(value * 127.0f)));
}

int bipolar_to_7bit(float value) {
    if (!std::isfinite(value)) return 64;
    return data7(64 + static_cast<int>(std::lround(value * 63.0f)));
}

std::vector<uint8_t> mpe_configuration(int member_channels) {
    std::vector<uint8_t> out;
    auto append = [&out](const std::vector<uint8_t>& m) { out.insert(out.end(), m.begin(), m.end()); };
    // RPN 0x0006 = MPE Configuration Message, data entry MSB = member count
    append(control_change(kMasterChannel, 101, 0));
    append(control_change(kMasterChannel, 100, 6));
    append(control_change(kMasterChannel, 6, member_channels));
    // RPN null
    append(control_change(kMasterChannel, 101, 127));
    append(control_change(kMasterChannel, 100, 127));
    return out;
}

} // namespace midi

MidiSink::MidiSink(const MidiSinkConfig& config)
    : config_(config) {
    int members = std::max(1, std::min(midi::kMaxMemberChannels, config_.member_channels));
    config_.member_channels = members;
    slots_.resize(static_cast<std::size_t>(members));
}

MidiSink::~MidiSink() { close(); }

bool MidiSink::open() {
    last_error_.clear();
    if (fd_ >= 0) return true;
    int fd = ::open(config_.device_path.c_str(), O_WRONLY | O_NONBLOCK);
    if (fd < 0) {
        last_error_ = "open " + config_.device_path + ": " + std::strerror(errno);
        std::cerr << "[MidiSink] " << last_error_ << "\n";
        return false;
    }
    fd_ = fd;
    owns_fd_ = true;
    return configure();
}

bool MidiSink::open_fd(int fd, bool take_ownership) {
    last_error_.clear();
    if (fd < 0) {
        last_error_ = "invalid descriptor";
        return false;
    }
    close();
    fd_ = fd;
    owns_fd_ = take_ownership;
    return configure();
}

bool MidiSink::configure() {
    if (!write_bytes(midi::mpe_configuration(config_.member_channels))) {
        std::cerr << "[MidiSink] Failed to send MPE configuration: " << last_error_ << "\n";
        return false;
    }
    if (config_.verbose) {
        std::cerr << "[MidiSink] MPE lower zone with " << config_.member_channels
                  << " member channels on " << name() << "\n";
    }
    return true;
}

void MidiSink::close() {
    if (fd_ < 0) return;
    for (int ch = 0; ch <= config_.member_channels; ++ch) {
        if (!write_bytes(midi::control_change(ch, midi::kCcAllNotesOff, 0))) {
            std::cerr << "[MidiSink] All-notes-off failed on channel " << ch + 1 << ": "
                      << last_error_ << "\n";
            break;
        }
    }
    if (owns_fd_) ::close(fd_);
    fd_ = -1;
    owns_fd_ = false;
    for (auto& s : slots_) s = ChannelSlot{};
}

bool MidiSink::write_bytes(const std::vector<uint8_t>& bytes) {
    if (fd_ < 0) {
        last_error_ = "device not open";
        return false;
    }
    ssize_t n = ::write(fd_, bytes.data(), bytes.size());
    if (n < 0) {
        last_error_ = std::string("write: ") + std::strerror(errno);
        return false;
    }
    if (static_cast<std::size_t>(n) != bytes.size()) {
        last_error_ = "short write";
        return false;
    }
    return true;
}

int MidiSink::channel_of(int voice) const {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].voice == voice && voice >= 0) return static_cast<int>(i) + 1;
    }
    return -1;
}

std::size_t MidiSink::pick_slot(int voice, bool& steal) const {
    steal = false;
    int bound = channel_of(voice);
    if (bound > 0) return static_cast<std::size_t>(bound - 1);

    // Least recently used free channel, so release tails are not cut short
    std::size_t best = slots_.size();
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].voice >= 0) continue;
        if (best == slots_.size() || slots_[i].age < slots_[best].age) best = i;
    }
    if (best < slots_.size()) return best;

    // Pool exhausted: steal the oldest voice
    steal = true;
    best = 0;
    for (std::size_t i = 1; i < slots_.size(); ++i) {
        if (slots_[i].age < slots_[best].age) best = i;
    }
    return best;
}

bool MidiSink::send_note_on(int voice, int pitch, int velocity) {
    bool steal = false;
    std::size_t idx = pick_slot(voice, steal);
    int channel = static_cast<int>(idx) + 1;
    const ChannelSlot& slot = slots_[idx];

    std::vector<uint8_t> bytes;
    if (slot.voice >= 0) {
        // Retrigger of the same voice or a stolen channel
        bytes = midi::note_off(channel, slot.pitch);
    }
    auto centre = midi::pitch_bend(channel, 0.0f);
    bytes.insert(bytes.end(), centre.begin(), centre.end());
    auto on = midi::note_on(channel, pitch, velocity);
    bytes.insert(bytes.end(), on.begin(), on.end());

    if (!write_bytes(bytes)) return false;

    if (steal && config_.verbose) {
        std::cerr << "[MidiSink] Voice " << slot.voice << " stolen by voice " << voice
                  << " on channel " << channel + 1 << "\n";
    }
    ChannelSlot& s = slots_[idx];
    s.voice = voice;
    s.pitch = pitch;
    s.age = ++allocations_;
    return true;
}

bool MidiSink::send_note_off(int voice) {
    int channel = channel_of(voice);
    // Nothing sounds for this voice
    if (channel < 0) return true;

    ChannelSlot& s = slots_[static_cast<std::size_t>(channel - 1)];
    if (!write_bytes(midi::note_off(channel, s.pitch))) return false;
    s.voice = -1;
    return true;
}

bool MidiSink::send_parameter(const std::string& name, float value) {
    // The parameter stream has no MIDI rendering
    (void)name;
    (void)value;
    return true;
}

bool MidiSink::send_control_change(const std::string& name, float value, int voice) {
    int channel = midi::kMasterChannel;
    if (voice >= 0) {
        channel = channel_of(voice);
        // Per-voice control for a voice that is not sounding
        if (channel < 0) return true;
    }

    if (name == "pitchBend") return write_bytes(midi::pitch_bend(channel, value));
    if (name == "filter") {
        return write_bytes(midi::control_change(channel, midi::kCcBrightness, midi::bipolar_to_7bit(value)));
    }
    if (name == "expression") {
        return write_bytes(midi::control_change(channel, midi::kCcExpression, midi::unit_to_7bit(value)));
    }
    if (name == "texture") {
        return write_bytes(midi::control_change(channel, midi::kCcTimbre, midi::unit_to_7bit(value)));
    }
    if (name == "vibrato") {
        return write_bytes(midi::control_change(channel, midi::kCcModulation, midi::unit_to_7bit(value)));
    }
    // "chord" and unknown controls are not rendered
    return true;
}

std::string MidiSink::name() const {
    return config_.device_path.empty() ? "midi:fd" + std::to_string(fd_) : "midi:" + config_.device_path;
}

} // namespace cuerpo
