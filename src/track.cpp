// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/track.hpp>
#include <algorithm>
#include <numeric>

namespace detstab {

Track::Track(TrackId id, const Detection& det, int history_size)
    : id_(id)
    , class_name_(det.class_name)
    , class_id_(det.class_id)
    , box_(det.box)
    , confidence_(det.confidence)
    , history_size_(static_cast<size_t>(std::max(1, history_size)))
    , consecutive_frames_(1)
    , gap_frames_(0)
    , state_(TrackState::Provisional)
    , matched_this_frame_(true)
{
    push_confidence(det.confidence);
}

void Track::update(const Detection& det) {
    box_ = det.box;
    confidence_ = det.confidence;
    if (det.class_id) {
        class_id_ = det.class_id;
    }
    push_confidence(det.confidence);

    consecutive_frames_++;
    gap_frames_ = 0;
    matched_this_frame_ = true;
}

void Track::mark_missed() {
    gap_frames_++;
    matched_this_frame_ = false;
}

float Track::avg_confidence() const {
    if (history_.empty()) {
        return confidence_;
    }
    float sum = std::accumulate(history_.begin(), history_.end(), 0.0f);
    return sum / static_cast<float>(history_.size());
}

Detection Track::to_detection() const {
    Detection det(class_name_, confidence_, box_, class_id_);
    det.stabilization = StabilizationInfo{id_, avg_confidence(), consecutive_frames_};
    return det;
}

void Track::push_confidence(float conf) {
    history_.push_back(conf);
    while (history_.size() > history_size_) {
        history_.pop_front();
    }
}

} // namespace detstab
