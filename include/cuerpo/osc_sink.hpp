#pragma once

#include "cuerpo/output_sink.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cuerpo {

namespace osc {

// One typed OSC argument ('i' int32 or 'f' float32)
struct Argument {
    char tag;
    int32_t i;
    float f;

    static Argument from_int(int32_t v) { return Argument{'i', v, 0.0f}; }
    static Argument from_float(float v) { return Argument{'f', 0, v}; }
};

// Binary OSC 1.0 message: padded address, padded type tags, big-endian arguments
std::vector<uint8_t> encode_message(const std::string& address, const std::vector<Argument>& args);

// "#bundle" with the given time tag (1 = immediately) wrapping size-prefixed elements
std::vector<uint8_t> encode_bundle(const std::vector<std::vector<uint8_t>>& elements,
                                   uint64_t timetag = 1);

} // namespace osc

struct OscSinkConfig {
    std::string host{"127.0.0.1"};
    uint16_t port{57120};
    bool bundle_parameters{false};  // Collect parameter updates into one bundle per flush
    bool verbose{false};
};

// Parameter and note stream over UDP
class OscSink : public OutputSink {
public:
    explicit OscSink(const OscSinkConfig& config);
    ~OscSink() override;

    OscSink(const OscSink&) = delete;
    OscSink& operator=(const OscSink&) = delete;

    // Resolve the host and create the socket; false with last_error() set on failure
    [[nodiscard]] bool open();
    void close();
    bool is_open() const { return fd_ >= 0; }

    bool send_parameter(const std::string& name, float value) override;
    bool send_note_on(int voice, int pitch, int velocity) override;
    bool send_note_off(int voice) override;
    bool send_control_change(const std::string& name, float value, int voice) override;
    bool flush() override;
    std::string name() const override;

    const std::string& last_error() const { return last_error_; }
    uint64_t packets_sent() const { return packets_sent_; }

private:
    bool send_packet(const std::vector<uint8_t>& packet);

    OscSinkConfig config_;
    int fd_{-1};
    std::vector<uint8_t> addr_;   // sockaddr storage of the resolved destination
    std::vector<std::vector<uint8_t>> pending_bundle_;
    std::string last_error_;
    uint64_t packets_sent_{0};
};

} // namespace cuerpo
