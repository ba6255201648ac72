// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/stabilizer.hpp>
#include <detstab/hysteresis.hpp>
#include <detstab/matching/matcher.hpp>
#include <detstab/track_registry.hpp>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace detstab::stabilizers {

/**
 * Temporal filtering + confidence hysteresis stabilizer
 *
 * Per frame and source:
 * - invalid detections are skipped and counted
 * - detections are matched greedily to same-label tracks (see Matcher)
 * - matched tracks advance when they clear the hysteresis threshold,
 *   everything else that owns a track decays by one gap frame
 * - unmatched detections above appear_confidence open provisional tracks
 * - tracks whose gap exceeds max_gap are removed
 * - confirmed tracks matched this frame are emitted, in creation order
 *
 * Example (min_frames=3, max_gap=2, appear=0.5, persist=0.3):
 *   f1 0.45 -> ignored | f2 0.55 -> provisional (1) | f3 0.52 -> (2)
 *   f4 0.58 -> confirmed, emitted | f5 0.35 -> kept, emitted
 *   f6, f7 -> gap 1, 2 | f8 -> gap 3, removed
 *
 * Each source has its own mutex held for a whole process(), reset() or
 * get_stats() call. The enabled flag is a separate atomic checked once at
 * the top of process().
 *
 * Per-source state is created on the first process() for a source id and
 * lives as long as the stabilizer; reset() empties it but does not free it.
 * Callers cycling through many short-lived source ids should reuse ids or
 * recreate the stabilizer to bound memory.
 */
class TemporalHysteresisStabilizer : public BaseStabilizer {
public:
    /**
     * @param config Stabilization parameters, validated here
     * @param matcher Matching strategy; when null one is built from config
     * @throws InvalidConfigError if config is invalid
     */
    explicit TemporalHysteresisStabilizer(const StabilizationConfig& config,
                                          std::unique_ptr<matching::Matcher> matcher = nullptr);

    Detections process(const Detections& detections, SourceId source_id = 0) override;
    void reset(SourceId source_id) override;
    void reset_all() override;
    void reset_stats(SourceId source_id) override;
    StabilizationStats get_stats(SourceId source_id = 0) const override;
    std::string name() const override { return "TemporalHysteresisStabilizer"; }

    const matching::Matcher& matcher() const { return *matcher_; }

private:
    struct Counters {
        uint64_t detected = 0;
        uint64_t confirmed = 0;
        uint64_t ignored = 0;
        uint64_t removed = 0;
        uint64_t invalid = 0;
    };

    struct SourceState {
        explicit SourceState(int history_size) : registry(history_size) {}

        mutable std::mutex mutex;
        TrackRegistry registry;
        Counters counters;
    };

    SourceState& source(SourceId source_id);
    SourceState* find_source(SourceId source_id) const;

    Detections filter_valid(const Detections& detections, SourceId source_id,
                            Counters& counters) const;

    StabilizationConfig config_;
    std::unique_ptr<matching::Matcher> matcher_;
    TrackStateMachine state_machine_;

    // Guards the map only; entries are never erased so references stay valid
    mutable std::mutex sources_mutex_;
    std::unordered_map<SourceId, std::unique_ptr<SourceState>> sources_;
};

} // namespace detstab::stabilizers
