#include "cuerpo/landmark_buffer.hpp"

#include <algorithm>
#include <cmath>

namespace cuerpo {

namespace {

bool valid_id(int id) {
    return id >= 0 && id < kPoseLandmarkCount;
}

Velocity difference(const LandmarkSample& a, const LandmarkSample& b) {
    Velocity v;
    double dt = b.t - a.t;
    if (dt <= 0.0) return v;
    v.vx = static_cast<float>((b.x - a.x) / dt);
    v.vy = static_cast<float>((b.y - a.y) / dt);
    v.speed = Vec2(v.vx, v.vy).length();
    return v;
}

} // namespace

LandmarkFrameBuffer::LandmarkFrameBuffer(int capacity, float visibility_threshold,
                                         float gap_tolerance, float jerk_scale)
    : capacity_(static_cast<std::size_t>(std::max(capacity, 3))),
      visibility_threshold_(visibility_threshold),
      gap_tolerance_(gap_tolerance),
      jerk_scale_(jerk_scale) {}

void LandmarkFrameBuffer::push(const LandmarkFrame& frame) {
    now_ = frame.timestamp;
    for (const auto& lm : frame.landmarks) {
        if (!valid_id(lm.id) || lm.visibility < visibility_threshold_) continue;

        auto& h = history_[lm.id];
        // Reacquired after a long gap: old samples would fake a large derivative
        if (!h.empty() && frame.timestamp - h.back().t > gap_tolerance_) {
            h.clear();
        }
        h.push_back(LandmarkSample{frame.timestamp, lm.x, lm.y});
        while (h.size() > capacity_) h.pop_front();
    }
}

bool LandmarkFrameBuffer::is_stale(const std::deque<LandmarkSample>& h) const {
    return h.empty() || now_ - h.back().t > gap_tolerance_;
}

Velocity LandmarkFrameBuffer::velocity(int id) const {
    if (!valid_id(id)) return Velocity{};
    const auto& h = history_[id];
    if (h.size() < 2 || is_stale(h)) return Velocity{};
    return difference(h[h.size() - 2], h.back());
}

float LandmarkFrameBuffer::jerk(int id) const {
    if (!valid_id(id)) return 0.0f;
    const auto& h = history_[id];
    if (h.size() < 3 || is_stale(h)) return 0.0f;

    const auto& s0 = h[h.size() - 3];
    const auto& s1 = h[h.size() - 2];
    const auto& s2 = h.back();
    Velocity v0 = difference(s0, s1);
    Velocity v1 = difference(s1, s2);

    // Velocity estimates sit at the interval midpoints
    double dt = (s2.t - s0.t) / 2.0;
    if (dt <= 0.0) return 0.0f;
    float dv = Vec2(v1.vx - v0.vx, v1.vy - v0.vy).length();
    float j = static_cast<float>(dv / dt) / jerk_scale_;
    if (!std::isfinite(j)) return 0.0f;
    return std::max(0.0f, std::min(1.0f, j));
}

bool LandmarkFrameBuffer::is_current(int id) const {
    if (!valid_id(id)) return false;
    const auto& h = history_[id];
    return !h.empty() && h.back().t == now_;
}

bool LandmarkFrameBuffer::is_lost(int id) const {
    if (!valid_id(id)) return false;
    const auto& h = history_[id];
    return !h.empty() && is_stale(h);
}

std::size_t LandmarkFrameBuffer::sample_count(int id) const {
    return valid_id(id) ? history_[id].size() : 0;
}

void LandmarkFrameBuffer::clear() {
    for (auto& h : history_) h.clear();
    now_ = 0.0;
}

} // namespace cuerpo
