#include <gtest/gtest.h>
#include "cuerpo/midi_sink.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cmath>
#include <vector>

using namespace cuerpo;

using Bytes = std::vector<uint8_t>;

// Test channel voice message encoding
TEST(MidiBytesTest, ChannelMessages) {
    EXPECT_EQ(midi::note_on(1, 60, 100), (Bytes{0x91, 60, 100}));
    EXPECT_EQ(midi::note_off(3, 64), (Bytes{0x83, 64, 0}));
    EXPECT_EQ(midi::control_change(0, midi::kCcBrightness, 200), (Bytes{0xB0, 74, 127}));
    // Centre: LSB first
    EXPECT_EQ(midi::pitch_bend(2, 0.0f), (Bytes{0xE2, 0x00, 0x40}));
    EXPECT_EQ(midi::pitch_bend(2, 1.0f), (Bytes{0xE2, 0x7F, 0x7F}));
}

// Test value conversions and their clamping
TEST(MidiBytesTest, ValueConversions) {
    EXPECT_EQ(midi::bend_to_14bit(0.0f), 8192);
    EXPECT_EQ(midi::bend_to_14bit(1.0f), 16383);
    EXPECT_EQ(midi::bend_to_14bit(-1.0f), 1);
    EXPECT_EQ(midi::bend_to_14bit(5.0f), 16383);
    EXPECT_EQ(midi::bend_to_14bit(std::nanf("")), 8192);

    EXPECT_EQ(midi::unit_to_7bit(0.0f), 0);
    EXPECT_EQ(midi::unit_to_7bit(1.0f), 127);
    EXPECT_EQ(midi::unit_to_7bit(-0.5f), 0);

    EXPECT_EQ(midi::bipolar_to_7bit(0.0f), 64);
    EXPECT_EQ(midi::bipolar_to_7bit(1.0f), 127);
    EXPECT_EQ(midi::bipolar_to_7bit(-1.0f), 1);
}

// Test the MPE configuration RPN sequence on the master channel
TEST(MidiBytesTest, MpeConfiguration) {
    EXPECT_EQ(midi::mpe_configuration(15), (Bytes{
        0xB0, 101, 0,
        0xB0, 100, 6,
        0xB0, 6, 15,
        0xB0, 101, 127,
        0xB0, 100, 127
    }));
}

class MidiSinkTest : public ::testing::Test {
protected:
    int fds[2] = {-1, -1};

    void SetUp() override {
        ASSERT_EQ(::pipe(fds), 0);
        ::fcntl(fds[0], F_SETFL, O_NONBLOCK);
    }

    void TearDown() override {
        if (fds[0] >= 0) ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }

    MidiSinkConfig sink_config(int members = midi::kMaxMemberChannels) {
        MidiSinkConfig config;
        config.member_channels = members;
        return config;
    }

    // Everything written since the last call
    Bytes drain() {
        Bytes out;
        uint8_t buf[256];
        ssize_t n;
        while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) out.insert(out.end(), buf, buf + n);
        return out;
    }
};

// Test that the configuration goes out when the descriptor is attached
TEST_F(MidiSinkTest, OpenSendsConfiguration) {
    MidiSink sink(sink_config(4));
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    EXPECT_TRUE(sink.is_open());
    EXPECT_EQ(drain(), midi::mpe_configuration(4));
}

// Test that a missing device fails to open
TEST_F(MidiSinkTest, OpenMissingDeviceFails) {
    MidiSinkConfig config;
    config.device_path = "/nonexistent/midi";
    MidiSink sink(config);
    EXPECT_FALSE(sink.open());
    EXPECT_FALSE(sink.last_error().empty());
    EXPECT_FALSE(sink.is_open());
}

// Test each voice gets its own member channel with a centred bend
TEST_F(MidiSinkTest, VoicesGetOwnChannels) {
    MidiSink sink(sink_config());
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    drain();

    ASSERT_TRUE(sink.send_note_on(0, 55, 100));
    EXPECT_EQ(drain(), (Bytes{0xE1, 0x00, 0x40, 0x91, 55, 100}));
    ASSERT_TRUE(sink.send_note_on(1, 59, 100));
    EXPECT_EQ(drain(), (Bytes{0xE2, 0x00, 0x40, 0x92, 59, 100}));
    EXPECT_EQ(sink.channel_of(0), 1);
    EXPECT_EQ(sink.channel_of(1), 2);
    EXPECT_EQ(sink.channel_of(4), -1);

    ASSERT_TRUE(sink.send_note_off(0));
    EXPECT_EQ(drain(), (Bytes{0x81, 55, 0}));
    EXPECT_EQ(sink.channel_of(0), -1);

    // The released channel is not reused while untouched ones remain
    ASSERT_TRUE(sink.send_note_on(4, 60, 90));
    EXPECT_EQ(sink.channel_of(4), 3);
    drain();
}

// Test a retriggered voice ends its previous note on the same channel
TEST_F(MidiSinkTest, RetriggerSameVoice) {
    MidiSink sink(sink_config());
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    drain();

    ASSERT_TRUE(sink.send_note_on(4, 60, 90));
    drain();
    ASSERT_TRUE(sink.send_note_on(4, 62, 80));
    EXPECT_EQ(drain(), (Bytes{0x81, 60, 0, 0xE1, 0x00, 0x40, 0x91, 62, 80}));
    EXPECT_EQ(sink.channel_of(4), 1);
}

// Test the oldest voice is stolen when every channel is busy
TEST_F(MidiSinkTest, StealsOldestWhenExhausted) {
    MidiSink sink(sink_config(2));
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    drain();

    ASSERT_TRUE(sink.send_note_on(0, 48, 100));
    ASSERT_TRUE(sink.send_note_on(1, 52, 100));
    drain();

    ASSERT_TRUE(sink.send_note_on(5, 72, 110));
    EXPECT_EQ(drain(), (Bytes{0x81, 48, 0, 0xE1, 0x00, 0x40, 0x91, 72, 110}));
    EXPECT_EQ(sink.channel_of(0), -1);
    EXPECT_EQ(sink.channel_of(5), 1);

    // NoteOff for the stolen voice is a no-op
    EXPECT_TRUE(sink.send_note_off(0));
    EXPECT_TRUE(drain().empty());
}

// Test control mapping onto master and member channels
TEST_F(MidiSinkTest, ControlMapping) {
    MidiSink sink(sink_config());
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    drain();

    ASSERT_TRUE(sink.send_control_change("expression", 1.0f, voices::kGlobal));
    ASSERT_TRUE(sink.send_control_change("filter", -1.0f, voices::kGlobal));
    ASSERT_TRUE(sink.send_control_change("texture", 0.0f, voices::kGlobal));
    EXPECT_EQ(drain(), (Bytes{0xB0, 11, 127, 0xB0, 74, 1, 0xB0, 71, 0}));

    // Per-voice controls for a silent voice and unrendered controls are skipped
    EXPECT_TRUE(sink.send_control_change("pitchBend", 0.5f, 4));
    EXPECT_TRUE(sink.send_control_change("chord", 2.0f, voices::kGlobal));
    EXPECT_TRUE(sink.send_parameter("energy", 0.4f));
    EXPECT_TRUE(drain().empty());

    ASSERT_TRUE(sink.send_note_on(4, 60, 90));
    drain();
    ASSERT_TRUE(sink.send_control_change("vibrato", 1.0f, 4));
    ASSERT_TRUE(sink.send_control_change("pitchBend", -1.0f, 4));
    EXPECT_EQ(drain(), (Bytes{0xB1, 1, 127, 0xE1, 0x01, 0x00}));
}

// Test close() silences every channel of the zone
TEST_F(MidiSinkTest, CloseSendsAllNotesOff) {
    MidiSink sink(sink_config(2));
    ASSERT_TRUE(sink.open_fd(fds[1], false));
    ASSERT_TRUE(sink.send_note_on(0, 48, 100));
    drain();

    sink.close();
    EXPECT_FALSE(sink.is_open());
    EXPECT_EQ(drain(), (Bytes{0xB0, 123, 0, 0xB1, 123, 0, 0xB2, 123, 0}));
    EXPECT_EQ(sink.channel_of(0), -1);
}

// Test sends fail cleanly without a device
TEST_F(MidiSinkTest, SendWithoutDeviceFails) {
    MidiSink sink(sink_config());
    EXPECT_FALSE(sink.send_note_on(0, 60, 100));
    EXPECT_EQ(sink.last_error(), "device not open");
    EXPECT_EQ(sink.channel_of(0), -1);
}
