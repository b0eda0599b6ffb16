// make_recording.cpp
// Writes a synthetic performance as a JSON-lines landmark recording
// Usage: make_recording [out.jsonl] [seconds] [fps]
// Without an output path the recording goes to stdout.

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

#include "cuerpo/recording.hpp"
#include "cuerpo/synthetic_pose.hpp"

int main(int argc, char **argv)
{
    std::string path = argc > 1 ? argv[1] : "";
    double seconds = argc > 2 ? std::atof(argv[2]) : 12.0;
    double fps = argc > 3 ? std::atof(argv[3]) : 30.0;
    if (seconds <= 0.0 || fps <= 0.0)
    {
        std::cerr << "Usage: make_recording [out.jsonl] [seconds > 0] [fps > 0]\n";
        return 2;
    }

    std::ofstream file;
    if (!path.empty())
    {
        file.open(path, std::ios::trunc);
        if (!file.is_open())
        {
            std::cerr << "Failed to open " << path << " for writing\n";
            return 2;
        }
    }
    std::ostream &out = path.empty() ? std::cout : file;

    // Fixed seed keeps recordings reproducible
    std::mt19937 rng(4180);
    std::normal_distribution<float> jitter(0.0f, 0.002f);
    const double kPi = 3.14159265358979;

    const int frames = static_cast<int>(seconds * fps);
    for (int i = 0; i < frames; ++i)
    {
        double t = i / fps;
        cuerpo::PoseParams p;

        // Walk across the four chord zones and back every 8 s
        p.center_x = static_cast<float>(0.5 - 0.4 * std::cos(2.0 * kPi * t / 8.0));
        // Sway the hips past the extension threshold every 5 s
        p.hip_tilt_deg = static_cast<float>(25.0 * std::sin(2.0 * kPi * t / 5.0));
        p.head_tilt_deg = static_cast<float>(10.0 * std::sin(2.0 * kPi * t / 3.0));
        p.knee_bend = static_cast<float>(0.5 + 0.5 * std::sin(2.0 * kPi * t / 6.0));

        // Right hand flicks upwards for two frames every 1.5 s
        double phase = std::fmod(t, 1.5);
        float flick = phase < 2.0 / fps ? 0.25f : 0.0f;
        p.right_wrist = cuerpo::Vec2(0.35f + jitter(rng), 0.50f - flick + jitter(rng));

        // Left hand circles slowly with the elbow swinging out
        p.left_wrist = cuerpo::Vec2(static_cast<float>(0.68 + 0.05 * std::cos(2.0 * kPi * t / 2.0)),
                                    static_cast<float>(0.40 + 0.10 * std::sin(2.0 * kPi * t / 2.0)));

        out << cuerpo::frame_to_json(cuerpo::make_pose_frame(t, p)) << "\n";
    }

    if (!out)
    {
        std::cerr << "Write error\n";
        return 1;
    }
    if (!path.empty())
        std::cerr << "Wrote " << frames << " frames to " << path << "\n";
    return 0;
}
