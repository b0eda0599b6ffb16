#pragma once

namespace cuerpo {

struct ZoneResult {
    int zone;      // 0-3, left to right
    bool changed;  // True only on a confirmed crossing
};

// Four equal bands over feetCenterX with boundary hysteresis
class ZoneClassifier {
public:
    explicit ZoneClassifier(float hysteresis_margin);

    // The first call of a session sets the zone without reporting a change
    ZoneResult classify(float feet_center_x);

    bool has_zone() const { return zone_ >= 0; }
    int zone() const { return zone_; }
    float last_crossing() const { return last_crossing_; }
    float margin() const { return margin_; }

    void reset();

    // Band of x ignoring hysteresis
    static int band_of(float x);

    // Scale degree of the chord root for zone (I, IV, V, vi)
    static int chord_root_degree(int zone);
    static const char* chord_name(int zone);

private:
    float margin_;
    int zone_{-1};
    float last_crossing_{0.0f};
};

} // namespace cuerpo
