#include <gtest/gtest.h>
#include "cuerpo/dispatcher.hpp"

#include <mutex>
#include <vector>

using namespace cuerpo;

namespace {

// Records deliveries; fails the next N sends of a kind on request
class RecordingSink : public OutputSink {
public:
    int note_on_failures = 0;
    int note_off_failures = 0;
    bool fail_controls = false;
    int flushes = 0;

    bool send_parameter(const std::string& name, float value) override {
        return record(ControlMessage::parameter(name, value), fail_controls);
    }
    bool send_note_on(int voice, int pitch, int velocity) override {
        return record(ControlMessage::note_on(voice, pitch, velocity), take(note_on_failures));
    }
    bool send_note_off(int voice) override {
        return record(ControlMessage::note_off(voice), take(note_off_failures));
    }
    bool send_control_change(const std::string& name, float value, int voice) override {
        return record(ControlMessage::control_change(name, value, voice), fail_controls);
    }
    bool flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        flushes++;
        return true;
    }
    std::string name() const override { return "recording"; }

    std::vector<ControlMessage> delivered() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delivered_;
    }

private:
    static bool take(int& failures) {
        if (failures > 0) {
            --failures;
            return true;
        }
        return false;
    }

    bool record(const ControlMessage& msg, bool fail) {
        if (fail) return false;
        std::lock_guard<std::mutex> lock(mutex_);
        delivered_.push_back(msg);
        return true;
    }

    mutable std::mutex mutex_;
    std::vector<ControlMessage> delivered_;
};

DispatchConfig fast_config() {
    DispatchConfig config;
    config.max_note_attempts = 3;
    config.retry_backoff_ms = 1;
    config.idle_wait_ms = 1;
    return config;
}

}

class DispatcherTest : public ::testing::Test {
protected:
    RecordingSink sink;
};

// Test a synchronous pass delivers in submission order and flushes once
TEST_F(DispatcherTest, DeliversInOrder) {
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_on(0, 60, 100),
                       ControlMessage::control_change("pitchBend", 0.2f, 0),
                       ControlMessage::parameter("hipTilt", 0.1f)});
    EXPECT_EQ(dispatcher.pending(), 3u);
    EXPECT_EQ(dispatcher.pump(), 3u);

    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOn);
    EXPECT_EQ(out[1].kind, MessageKind::ControlChange);
    EXPECT_EQ(out[2].kind, MessageKind::ParameterUpdate);
    EXPECT_EQ(sink.flushes, 1);
    EXPECT_EQ(dispatcher.pending(), 0u);
    EXPECT_EQ(dispatcher.get_stats().delivered, 3u);
}

// Test an empty pass neither sends nor flushes
TEST_F(DispatcherTest, EmptyPumpIsNoop) {
    MessageDispatcher dispatcher(sink, fast_config());
    EXPECT_EQ(dispatcher.pump(), 0u);
    EXPECT_EQ(sink.flushes, 0);
}

// Test that a newer continuous value replaces the undelivered one
TEST_F(DispatcherTest, ContinuousValuesCoalesce) {
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::control_change("pitchBend", 0.1f, 0),
                       ControlMessage::note_on(4, 60, 90)});
    dispatcher.submit({ControlMessage::control_change("pitchBend", 0.3f, 0),
                       ControlMessage::control_change("pitchBend", 0.5f, 1)});
    dispatcher.pump();

    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOn);
    EXPECT_FLOAT_EQ(out[1].value, 0.3f);
    EXPECT_EQ(out[1].voice, 0);
    EXPECT_EQ(out[2].voice, 1);
    EXPECT_EQ(dispatcher.get_stats().superseded, 1u);
}

// Test that notes are never coalesced
TEST_F(DispatcherTest, NotesAreNeverCoalesced) {
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_on(4, 60, 90), ControlMessage::note_off(4)});
    dispatcher.submit({ControlMessage::note_on(4, 62, 90), ControlMessage::note_off(4)});
    EXPECT_EQ(dispatcher.pump(), 4u);
    EXPECT_EQ(dispatcher.get_stats().superseded, 0u);
}

// Test the backpressure cap drops the oldest continuous message, never a note
TEST_F(DispatcherTest, CapDropsOldestControl) {
    DispatchConfig config = fast_config();
    config.max_pending_controls = 2;
    MessageDispatcher dispatcher(sink, config);
    dispatcher.submit({ControlMessage::parameter("energy", 0.1f),
                       ControlMessage::note_on(0, 48, 100),
                       ControlMessage::parameter("symmetry", 0.2f),
                       ControlMessage::parameter("smoothness", 0.3f)});
    dispatcher.pump();

    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOn);
    EXPECT_EQ(out[1].name, "symmetry");
    EXPECT_EQ(out[2].name, "smoothness");
    EXPECT_EQ(dispatcher.get_stats().dropped, 1u);
}

// Test transient note failures are retried
TEST_F(DispatcherTest, NoteRetriedAfterTransientFailure) {
    sink.note_on_failures = 2;
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_on(4, 60, 90)});
    EXPECT_EQ(dispatcher.pump(), 1u);
    EXPECT_EQ(dispatcher.get_stats().note_retries, 2u);
    EXPECT_EQ(dispatcher.get_stats().compensations, 0u);
}

// Test an undeliverable NoteOn is followed by a NoteOff for its voice
TEST_F(DispatcherTest, UndeliverableNoteOnIsCompensated) {
    sink.note_on_failures = 3;
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_on(5, 72, 90),
                       ControlMessage::control_change("vibrato", 0.4f, 5)});
    dispatcher.pump();

    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOff);
    EXPECT_EQ(out[0].voice, 5);
    EXPECT_EQ(out[1].name, "vibrato");
    EXPECT_EQ(dispatcher.get_stats().compensations, 1u);
}

// Test an undeliverable NoteOff is parked and sent first on the next pass
TEST_F(DispatcherTest, UndeliverableNoteOffIsParked) {
    sink.note_off_failures = 3;
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_off(3)});
    EXPECT_EQ(dispatcher.pump(), 0u);
    EXPECT_EQ(dispatcher.parked(), 1u);
    EXPECT_EQ(dispatcher.get_stats().parked, 1u);

    dispatcher.submit({ControlMessage::note_on(3, 59, 100)});
    EXPECT_EQ(dispatcher.pump(), 2u);
    EXPECT_EQ(dispatcher.parked(), 0u);

    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOff);
    EXPECT_EQ(out[1].kind, MessageKind::NoteOn);
}

// Test a sink that never recovers keeps at most one parked NoteOff per voice
TEST_F(DispatcherTest, ParkingIsBoundedPerVoice) {
    sink.note_on_failures = 1000000;
    sink.note_off_failures = 1000000;
    MessageDispatcher dispatcher(sink, fast_config());
    for (int i = 0; i < 10; ++i) {
        dispatcher.submit({ControlMessage::note_on(voices::kMelodyRight, 60, 90),
                           ControlMessage::note_off(voices::kMelodyRight),
                           ControlMessage::note_on(voices::kMelodyLeft, 72, 90)});
        dispatcher.pump();
        EXPECT_LE(dispatcher.parked(), 2u);
    }
    EXPECT_EQ(dispatcher.parked(), 2u);
    EXPECT_EQ(dispatcher.get_stats().parked, 2u);
    EXPECT_EQ(dispatcher.get_stats().compensations, 20u);
    EXPECT_TRUE(sink.delivered().empty());
}

// Test a delivered NoteOn discards the parked NoteOff of its voice
TEST_F(DispatcherTest, NewerNoteOnDiscardsParkedNoteOff) {
    sink.note_off_failures = 3;
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::note_off(4)});
    dispatcher.pump();
    ASSERT_EQ(dispatcher.parked(), 1u);

    // The parked NoteOff fails once more, then the new note goes through
    sink.note_off_failures = 1;
    dispatcher.submit({ControlMessage::note_on(4, 64, 100)});
    EXPECT_EQ(dispatcher.pump(), 1u);
    EXPECT_EQ(dispatcher.parked(), 0u);
    EXPECT_EQ(dispatcher.get_stats().unparked, 1u);

    // Nothing later cuts the new note short
    EXPECT_EQ(dispatcher.pump(), 0u);
    auto out = sink.delivered();
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].kind, MessageKind::NoteOn);
}

// Test failed continuous messages are dropped, not retried
TEST_F(DispatcherTest, FailedControlIsDropped) {
    sink.fail_controls = true;
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.submit({ControlMessage::control_change("filter", 0.5f)});
    EXPECT_EQ(dispatcher.pump(), 0u);
    EXPECT_EQ(dispatcher.get_stats().dropped, 1u);
    EXPECT_EQ(dispatcher.pending(), 0u);
}

// Test the worker thread delivers everything, and stop() drains the rest
TEST_F(DispatcherTest, WorkerDeliversAndStopDrains) {
    MessageDispatcher dispatcher(sink, fast_config());
    dispatcher.start();
    EXPECT_TRUE(dispatcher.is_running());
    for (int i = 0; i < 50; ++i) {
        dispatcher.submit({ControlMessage::note_on(4, 60, 90), ControlMessage::note_off(4)});
    }
    dispatcher.stop();
    EXPECT_FALSE(dispatcher.is_running());

    EXPECT_EQ(dispatcher.pending(), 0u);
    EXPECT_EQ(sink.delivered().size(), 100u);
    EXPECT_EQ(dispatcher.get_stats().submitted, 100u);
}
