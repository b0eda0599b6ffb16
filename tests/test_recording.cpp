#include <gtest/gtest.h>
#include "cuerpo/recording.hpp"
#include "cuerpo/synthetic_pose.hpp"

#include <cstdio>
#include <sstream>

using namespace cuerpo;

// Test parsing a frame line with defaults for z and v
TEST(RecordingTest, ParseFrameWithDefaults) {
    LandmarkFrame frame;
    std::string error;
    ASSERT_TRUE(parse_frame(R"({"t": 0.5, "landmarks": [{"id": 16, "x": 0.4, "y": 0.55}]})",
                            frame, &error)) << error;
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.5);
    ASSERT_EQ(frame.landmarks.size(), 1u);
    const Landmark* wrist = frame.find(landmarks::kRightWrist);
    ASSERT_NE(wrist, nullptr);
    EXPECT_FLOAT_EQ(wrist->x, 0.4f);
    EXPECT_FLOAT_EQ(wrist->z, 0.0f);
    EXPECT_FLOAT_EQ(wrist->visibility, 1.0f);
}

// Test malformed lines are reported
TEST(RecordingTest, ParseFrameRejectsMalformed) {
    LandmarkFrame frame;
    std::string error;
    EXPECT_FALSE(parse_frame("{not json", frame, &error));
    EXPECT_EQ(error, "invalid JSON");
    EXPECT_FALSE(parse_frame("[1, 2]", frame, &error));
    EXPECT_FALSE(parse_frame(R"({"landmarks": []})", frame, &error));
    EXPECT_FALSE(parse_frame(R"({"t": 1, "landmarks": [{"id": 1.5, "x": 0, "y": 0}]})", frame, &error));
    EXPECT_FALSE(parse_frame(R"({"t": 1, "landmarks": [{"id": 2, "x": 0}]})", frame, &error));
    EXPECT_NE(error.find("without x/y"), std::string::npos);
}

// Test a serialized synthetic frame parses back to the same landmarks
TEST(RecordingTest, SerializedFrameParses) {
    LandmarkFrame written = make_pose_frame(1.25, PoseParams{});
    LandmarkFrame parsed;
    ASSERT_TRUE(parse_frame(frame_to_json(written), parsed));
    EXPECT_DOUBLE_EQ(parsed.timestamp, 1.25);
    ASSERT_EQ(parsed.landmarks.size(), written.landmarks.size());
    const Landmark* nose = parsed.find(landmarks::kNose);
    ASSERT_NE(nose, nullptr);
    EXPECT_FLOAT_EQ(nose->y, written.find(landmarks::kNose)->y);
}

// Test the reader skips comments, blank lines and malformed lines
TEST(RecordingTest, ReaderSkipsNoise) {
    std::istringstream in(
        "# captured 2024-05-01\n"
        "\n"
        "{\"t\": 0.0, \"landmarks\": []}\n"
        "garbage\n"
        "   \n"
        "{\"t\": 0.033, \"landmarks\": [{\"id\": 0, \"x\": 0.5, \"y\": 0.2, \"v\": 0.9}]}\n");
    RecordingReader reader(in);

    LandmarkFrame frame;
    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.0);
    ASSERT_TRUE(reader.next(frame));
    EXPECT_DOUBLE_EQ(frame.timestamp, 0.033);
    EXPECT_FLOAT_EQ(frame.landmarks[0].visibility, 0.9f);
    EXPECT_EQ(reader.line_number(), 6);
    EXPECT_FALSE(reader.next(frame));
    EXPECT_EQ(reader.skipped_lines(), 1);
}

// Test whole-file save and load
TEST(RecordingTest, SaveAndLoadFile) {
    const char* path = "test_recording.jsonl";
    std::vector<LandmarkFrame> frames;
    for (int i = 0; i < 5; ++i) frames.push_back(make_pose_frame(i / 30.0, PoseParams{}));
    ASSERT_TRUE(save_recording(path, frames));

    std::vector<LandmarkFrame> loaded;
    ASSERT_TRUE(load_recording(path, loaded));
    std::remove(path);
    ASSERT_EQ(loaded.size(), 5u);
    EXPECT_DOUBLE_EQ(loaded[4].timestamp, 4 / 30.0);
    EXPECT_EQ(loaded[4].landmarks.size(), static_cast<size_t>(kPoseLandmarkCount));

    EXPECT_FALSE(load_recording("missing_recording.jsonl", loaded));
}
