#pragma once

#include "cuerpo/pose_types.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cuerpo {

// One frame per line: {"t": 0.033, "landmarks": [{"id": 0, "x": .5, "y": .2, "z": 0, "v": .99}, ...]}
// Missing "z" reads as 0 and missing "v" as 1.

// Parse one JSON line; false with error set when the line is not a frame
bool parse_frame(const std::string& line, LandmarkFrame& frame, std::string* error = nullptr);

// Serialize frame as one JSON line (no trailing newline)
std::string frame_to_json(const LandmarkFrame& frame);

// Reads frames from a JSON-lines stream one at a time; blank lines and '#' comments are skipped
class RecordingReader {
public:
    explicit RecordingReader(std::istream& in);

    // False at end of stream; malformed lines are logged and skipped
    bool next(LandmarkFrame& frame);

    int line_number() const { return line_no_; }
    int skipped_lines() const { return skipped_; }

private:
    std::istream& in_;
    int line_no_{0};
    int skipped_{0};
};

// Whole-file helpers
bool load_recording(const std::string& path, std::vector<LandmarkFrame>& frames);
bool save_recording(const std::string& path, const std::vector<LandmarkFrame>& frames);

} // namespace cuerpo
