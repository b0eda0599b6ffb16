#include "cuerpo/zone_classifier.hpp"
#include "cuerpo/session_config.hpp"

#include <algorithm>
#include <array>

namespace cuerpo {

namespace {

struct ChordEntry {
    const char* name;
    int root_degree;
};

// Zone -> triad of C major
const std::array<ChordEntry, constants::kZoneCount> kChordTable {{
    {"I", 0},
    {"IV", 3},
    {"V", 4},
    {"vi", 5}
}};

int clamp_zone(int zone) {
    return std::max(0, std::min(constants::kZoneCount - 1, zone));
}

} // namespace

ZoneClassifier::ZoneClassifier(float hysteresis_margin)
    : margin_(hysteresis_margin) {}

int ZoneClassifier::band_of(float x) {
    return clamp_zone(static_cast<int>(std::max(0.0f, x) / constants::kZoneWidth));
}

ZoneResult ZoneClassifier::classify(float feet_center_x) {
    if (zone_ < 0) {
        zone_ = band_of(feet_center_x);
        last_crossing_ = feet_center_x;
        return {zone_, false};
    }

    int next = zone_;
    // Moving right: lower edge of the new band must be passed by the margin
    for (int z = constants::kZoneCount - 1; z > zone_; --z) {
        if (feet_center_x >= z * constants::kZoneWidth + margin_) {
            next = z;
            break;
        }
    }
    // Moving left: upper edge of the new band must be passed by the margin
    if (next == zone_) {
        for (int z = 0; z < zone_; ++z) {
            if (feet_center_x <= (z + 1) * constants::kZoneWidth - margin_) {
                next = z;
                break;
            }
        }
    }

    if (next == zone_) return {zone_, false};

    zone_ = next;
    last_crossing_ = feet_center_x;
    return {zone_, true};
}

void ZoneClassifier::reset() {
    zone_ = -1;
    last_crossing_ = 0.0f;
}

int ZoneClassifier::chord_root_degree(int zone) {
    return kChordTable[clamp_zone(zone)].root_degree;
}

const char* ZoneClassifier::chord_name(int zone) {
    return kChordTable[clamp_zone(zone)].name;
}

} // namespace cuerpo
