// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/config.hpp>
#include <detstab/detection.hpp>
#include <detstab/track_registry.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace detstab::matching {

/**
 * Result of associating one frame's detections with a source's tracks.
 * Each track is assigned at most one detection and vice versa.
 */
struct Assignment {
    /// Indexed like the input detections: matched track id, or empty for "new"
    std::vector<std::optional<TrackId>> track_for_detection;
    /// Tracks that received no detection this frame, in creation order
    std::vector<TrackId> unmatched_tracks;
};

/**
 * Base matcher interface.
 *
 * Detections are visited in descending confidence (input order among equal
 * confidences); each one may only pick a not-yet-matched track with the
 * same class label. Subclasses decide which candidate wins.
 */
class Matcher {
public:
    virtual ~Matcher() = default;

    Assignment match(const Detections& detections, const TrackRegistry& registry) const;

    virtual std::string name() const = 0;

protected:
    /**
     * Pick the winning candidate for one detection
     * @param candidates Unmatched same-label tracks in creation order (non-empty)
     * @return Index into candidates, or -1 for no match
     */
    virtual int select(const Detection& det,
                       const std::vector<const Track*>& candidates) const = 0;
};

/**
 * Greedy spatial matching: the candidate with maximum IoU wins when that
 * IoU is strictly above the threshold. Ties go to the earliest-created track.
 * Not a global bipartite optimum.
 */
class IoUMatcher : public Matcher {
public:
    explicit IoUMatcher(float iou_threshold = 0.3f);

    std::string name() const override { return "IoUMatcher"; }
    float threshold() const { return iou_threshold_; }

protected:
    int select(const Detection& det,
               const std::vector<const Track*>& candidates) const override;

private:
    float iou_threshold_;
};

/**
 * Label-only matching: the earliest-created unmatched track of the same
 * label wins regardless of position
 */
class ClassOnlyMatcher : public Matcher {
public:
    std::string name() const override { return "ClassOnlyMatcher"; }

protected:
    int select(const Detection& det,
               const std::vector<const Track*>& candidates) const override;
};

/**
 * Create the matcher selected by a configuration
 */
std::unique_ptr<Matcher> create_matcher(const StabilizationConfig& config);

} // namespace detstab::matching
