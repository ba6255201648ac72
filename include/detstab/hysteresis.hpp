// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/config.hpp>
#include <detstab/detection.hpp>
#include <detstab/track.hpp>

namespace detstab {

/**
 * Dual confidence threshold (Schmitt-trigger style).
 * Creating or confirming an identity needs appear_confidence; keeping a
 * confirmed one alive only needs persist_confidence.
 */
class HysteresisPolicy {
public:
    HysteresisPolicy(float appear_confidence, float persist_confidence)
        : appear_(appear_confidence), persist_(persist_confidence) {}

    float threshold(const Track& track) const {
        return track.is_confirmed() ? persist_ : appear_;
    }

    /// Threshold for a detection without a track
    float new_track_threshold() const { return appear_; }

    bool admits(const Track& track, float confidence) const {
        return confidence >= threshold(track);
    }

    bool admits_new(float confidence) const { return confidence >= appear_; }

private:
    float appear_;
    float persist_;
};

/**
 * Per-frame outcome of a state machine step
 */
enum class TrackEvent {
    Advanced,    // accepted match, state unchanged
    Confirmed,   // accepted match that promoted the track
    Rejected,    // matched but below threshold, treated as a miss
    Missed,      // no detection this frame, track survives
    Expired      // gap exceeded max_gap, remove the track
};

/**
 * Applies match / no-match outcomes to a track once per frame
 */
class TrackStateMachine {
public:
    explicit TrackStateMachine(const StabilizationConfig& config);

    /**
     * Apply a detection the matcher assigned to this track.
     * Returns Rejected, or Expired when the rejection also ends the track.
     */
    TrackEvent on_match(Track& track, const Detection& det) const;

    /// Settle a freshly created track (confirms at once when min_frames is 1)
    TrackEvent on_spawn(Track& track) const;

    /// Apply a frame in which the track received no detection
    TrackEvent on_miss(Track& track) const;

    /// Whether an unmatched detection may open a new track
    bool should_spawn(const Detection& det) const {
        return policy_.admits_new(det.confidence);
    }

private:
    HysteresisPolicy policy_;
    int min_frames_;
    int max_gap_;
};

} // namespace detstab
