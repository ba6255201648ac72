// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/stabilizers/temporal_hysteresis.hpp>
#include <detstab/errors.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace detstab::stabilizers {

namespace {

const StabilizationConfig& validated(const StabilizationConfig& config) {
    config.validate();
    return config;
}

} // namespace

TemporalHysteresisStabilizer::TemporalHysteresisStabilizer(const StabilizationConfig& config,
                                                           std::unique_ptr<matching::Matcher> matcher)
    : config_(validated(config))
    , matcher_(matcher ? std::move(matcher) : matching::create_matcher(config_))
    , state_machine_(config_)
{
    if (config_.verbose) {
        std::clog << std::fixed << std::setprecision(2)
                  << "TemporalHysteresisStabilizer initialized: min_frames=" << config_.min_frames
                  << ", max_gap=" << config_.max_gap
                  << ", appear_conf=" << config_.appear_confidence
                  << ", persist_conf=" << config_.persist_confidence
                  << ", matcher=" << matcher_->name() << std::endl;
    }
}

TemporalHysteresisStabilizer::SourceState& TemporalHysteresisStabilizer::source(SourceId source_id) {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    auto& slot = sources_[source_id];
    if (!slot) {
        slot = std::make_unique<SourceState>(config_.history_size);
    }
    return *slot;
}

TemporalHysteresisStabilizer::SourceState*
TemporalHysteresisStabilizer::find_source(SourceId source_id) const {
    std::lock_guard<std::mutex> lock(sources_mutex_);
    auto it = sources_.find(source_id);
    return (it != sources_.end()) ? it->second.get() : nullptr;
}

Detections TemporalHysteresisStabilizer::filter_valid(const Detections& detections,
                                                      SourceId source_id,
                                                      Counters& counters) const {
    Detections valid;
    valid.reserve(detections.size());

    for (const auto& det : detections) {
        try {
            validate_detection(det);
            valid.push_back(det);
        } catch (const InvalidDetectionError& e) {
            counters.invalid++;
            std::cerr << "Warning: skipping detection on source " << source_id
                      << ": " << e.what() << std::endl;
        }
    }

    return valid;
}

Detections TemporalHysteresisStabilizer::process(const Detections& detections, SourceId source_id) {
    if (!is_enabled()) {
        return detections;
    }

    SourceState& state = source(source_id);
    std::lock_guard<std::mutex> lock(state.mutex);

    TrackRegistry& registry = state.registry;
    Counters& counters = state.counters;

    const Detections valid = filter_valid(detections, source_id, counters);
    counters.detected += valid.size();

    registry.begin_frame();
    const matching::Assignment assignment = matcher_->match(valid, registry);

    // 1. Matched detections advance their track or are rejected by the gate;
    //    unmatched ones may open a provisional track
    for (size_t i = 0; i < valid.size(); ++i) {
        const Detection& det = valid[i];

        if (const auto& track_id = assignment.track_for_detection[i]) {
            Track* track = registry.find(*track_id);
            if (track == nullptr) {
                continue;
            }

            const TrackEvent event = state_machine_.on_match(*track, det);
            if (event == TrackEvent::Confirmed) {
                counters.confirmed++;
                if (config_.verbose) {
                    std::clog << "Track confirmed: " << det.class_name << " #" << track->id()
                              << " after " << track->consecutive_frames() << " frames (avg_conf="
                              << std::fixed << std::setprecision(2) << track->avg_confidence()
                              << ")" << std::endl;
                }
            } else if (event == TrackEvent::Rejected || event == TrackEvent::Expired) {
                counters.ignored++;
            }
            continue;
        }

        if (!state_machine_.should_spawn(det)) {
            counters.ignored++;
            continue;
        }

        Track& track = registry.create(det);
        if (state_machine_.on_spawn(track) == TrackEvent::Confirmed) {
            counters.confirmed++;
        }
        if (config_.verbose) {
            std::clog << "New track: " << det.class_name << " #" << track.id() << " conf="
                      << std::fixed << std::setprecision(2) << det.confidence
                      << " (needs " << config_.min_frames << " frames)" << std::endl;
        }
    }

    // 2. Tracks without a detection decay
    for (TrackId id : assignment.unmatched_tracks) {
        if (Track* track = registry.find(id)) {
            state_machine_.on_miss(*track);
        }
    }

    // 3. Drop expired tracks
    const int max_gap = config_.max_gap;
    const size_t removed = registry.remove_if([max_gap](const Track& track) {
        return track.gap_frames() > max_gap;
    });
    counters.removed += removed;
    if (removed > 0 && config_.verbose) {
        std::clog << "Removed " << removed << " expired tracks on source " << source_id
                  << " (gap > " << max_gap << ")" << std::endl;
    }

    // 4. Emit confirmed tracks refreshed this frame, in creation order
    Detections stabilized;
    for (TrackId id : registry.ids()) {
        const Track* track = registry.find(id);
        if (track != nullptr && track->is_confirmed() && track->matched_this_frame()) {
            stabilized.push_back(track->to_detection());
        }
    }

    return stabilized;
}

void TemporalHysteresisStabilizer::reset(SourceId source_id) {
    SourceState* state = find_source(source_id);
    if (state == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->registry.clear();

    if (config_.verbose) {
        std::clog << "Stabilization tracks reset for source " << source_id << std::endl;
    }
}

void TemporalHysteresisStabilizer::reset_all() {
    std::lock_guard<std::mutex> sources_lock(sources_mutex_);
    for (auto& [id, state] : sources_) {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->registry.clear();
    }

    if (config_.verbose) {
        std::clog << "All stabilization tracks reset" << std::endl;
    }
}

void TemporalHysteresisStabilizer::reset_stats(SourceId source_id) {
    SourceState* state = find_source(source_id);
    if (state == nullptr) {
        return;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->counters = Counters{};
}

StabilizationStats TemporalHysteresisStabilizer::get_stats(SourceId source_id) const {
    StabilizationStats stats;
    stats.mode = to_string(StabilizationMode::Temporal);
    stats.enabled = is_enabled();

    const SourceState* state = find_source(source_id);
    if (state == nullptr) {
        return stats;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    stats.total_detected = state->counters.detected;
    stats.total_confirmed = state->counters.confirmed;
    stats.total_ignored = state->counters.ignored;
    stats.total_removed = state->counters.removed;
    stats.total_invalid = state->counters.invalid;
    stats.active_tracks = static_cast<int>(state->registry.size());
    stats.tracks_by_class = state->registry.counts_by_class();
    return stats;
}

} // namespace detstab::stabilizers
