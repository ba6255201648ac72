// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/hysteresis.hpp>

namespace detstab {

TrackStateMachine::TrackStateMachine(const StabilizationConfig& config)
    : policy_(config.appear_confidence, config.persist_confidence)
    , min_frames_(config.min_frames)
    , max_gap_(config.max_gap)
{
}

TrackEvent TrackStateMachine::on_match(Track& track, const Detection& det) const {
    if (!policy_.admits(track, det.confidence)) {
        // Rejected by the hysteresis gate: the track decays as if unmatched
        return on_miss(track) == TrackEvent::Expired ? TrackEvent::Expired : TrackEvent::Rejected;
    }

    track.update(det);

    if (!track.is_confirmed() && track.consecutive_frames() >= min_frames_) {
        track.confirm();
        return TrackEvent::Confirmed;
    }
    return TrackEvent::Advanced;
}

TrackEvent TrackStateMachine::on_spawn(Track& track) const {
    // The creating detection counts as the first accepted match
    if (track.consecutive_frames() >= min_frames_) {
        track.confirm();
        return TrackEvent::Confirmed;
    }
    return TrackEvent::Advanced;
}

TrackEvent TrackStateMachine::on_miss(Track& track) const {
    track.mark_missed();
    return track.gap_frames() > max_gap_ ? TrackEvent::Expired : TrackEvent::Missed;
}

} // namespace detstab
