#pragma once

#include "cuerpo/control_message.hpp"
#include "cuerpo/feature_extractor.hpp"
#include "cuerpo/feature_vector.hpp"
#include "cuerpo/gesture_trigger.hpp"
#include "cuerpo/mapper.hpp"
#include "cuerpo/pose_types.hpp"
#include "cuerpo/session_config.hpp"
#include "cuerpo/zone_classifier.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cuerpo {

// Session statistics
struct SessionStats {
    uint64_t frames_processed{0};
    uint64_t frames_rejected{0};
    uint64_t zone_changes{0};
    uint64_t onsets{0};
    uint64_t releases{0};
    uint64_t messages_emitted{0};

    void reset() noexcept {
        frames_processed = 0;
        frames_rejected = 0;
        zone_changes = 0;
        onsets = 0;
        releases = 0;
        messages_emitted = 0;
    }
};

// Owns all mutable pipeline state of one performance
class Session {
public:
    // Throws std::invalid_argument listing every configuration violation
    explicit Session(const SessionConfig& config);

    // Runs one frame through the pipeline and appends its messages to out.
    // Returns false (and logs) when the frame is rejected; state is untouched then.
    bool process(const LandmarkFrame& frame, MessageBatch& out);

    // Releases every sounding voice and resets the pipeline for a new performance
    void end(MessageBatch& out);

    // Structural checks applied before a frame reaches the pipeline
    bool validate_frame(const LandmarkFrame& frame, std::string* reason) const;

    const SessionConfig& config() const { return config_; }
    const SessionStats& stats() const { return stats_; }
    const std::optional<FeatureVector>& last_features() const { return last_features_; }
    int zone() const { return classifier_.zone(); }
    TriggerPhase phase(Limb limb) const;
    const Mapper& mapper() const { return mapper_; }

private:
    static TriggerConfig trigger_config(const SessionConfig& config);
    void record_event(Limb limb, const TriggerEvent& ev);

    SessionConfig config_;
    FeatureExtractor extractor_;
    ZoneClassifier classifier_;
    GestureTrigger right_;
    GestureTrigger left_;
    Mapper mapper_;
    SessionStats stats_;
    std::optional<FeatureVector> last_features_;
    bool has_timestamp_{false};
    double last_timestamp_{0.0};
};

} // namespace cuerpo
