// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <deque>
#include <string>

namespace detstab {

/**
 * Track state enumeration.
 * Removal is not a state: a removed track leaves its registry.
 */
enum class TrackState {
    Provisional = 0,
    Confirmed = 1
};

/**
 * A single tracked object's mutable state.
 * Owned exclusively by the TrackRegistry of one source.
 */
class Track {
public:
    Track(TrackId id, const Detection& det, int history_size);

    /**
     * Accept a matched detection: refresh box and confidence, clear the gap
     * and count one more consecutive frame
     */
    void update(const Detection& det);

    /**
     * Record a frame without an accepted match.
     * consecutive_frames is left untouched.
     */
    void mark_missed();

    void confirm() { state_ = TrackState::Confirmed; }
    void begin_frame() { matched_this_frame_ = false; }

    TrackId id() const { return id_; }
    const std::string& class_name() const { return class_name_; }
    const BoundingBox& box() const { return box_; }
    float confidence() const { return confidence_; }
    const std::deque<float>& confidence_history() const { return history_; }
    float avg_confidence() const;
    int consecutive_frames() const { return consecutive_frames_; }
    int gap_frames() const { return gap_frames_; }
    TrackState state() const { return state_; }
    bool is_confirmed() const { return state_ == TrackState::Confirmed; }
    bool matched_this_frame() const { return matched_this_frame_; }
    const std::optional<int>& class_id() const { return class_id_; }

    /// Build the detection this track emits for the current frame
    Detection to_detection() const;

private:
    void push_confidence(float conf);

    TrackId id_;
    std::string class_name_;
    std::optional<int> class_id_;
    BoundingBox box_;
    float confidence_;
    std::deque<float> history_;
    size_t history_size_;
    int consecutive_frames_;
    int gap_frames_;
    TrackState state_;
    bool matched_this_frame_;
};

} // namespace detstab
