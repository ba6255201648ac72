// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/config.hpp>
#include <detstab/detection.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace detstab {

/**
 * Read-only snapshot of one source's stabilization counters
 */
struct StabilizationStats {
    std::string mode = "temporal";
    bool enabled = true;
    uint64_t total_detected = 0;
    uint64_t total_confirmed = 0;
    uint64_t total_ignored = 0;
    uint64_t total_removed = 0;
    uint64_t total_invalid = 0;
    int active_tracks = 0;
    std::map<std::string, int> tracks_by_class;

    double confirm_ratio() const {
        return total_detected > 0
            ? static_cast<double>(total_confirmed) / static_cast<double>(total_detected)
            : 0.0;
    }
};

/**
 * Base stabilizer interface
 * All stabilization strategies should inherit from this class.
 *
 * process() is called by the frame path; the remaining operations may be
 * called concurrently from a control path.
 */
class BaseStabilizer {
public:
    BaseStabilizer() = default;
    virtual ~BaseStabilizer() = default;

    BaseStabilizer(const BaseStabilizer&) = delete;
    BaseStabilizer& operator=(const BaseStabilizer&) = delete;

    /**
     * Stabilize one frame of raw detections
     * @param detections Raw detections, unordered
     * @param source_id Input stream the frame belongs to
     * @return Stabilized detections; the input itself while disabled
     */
    virtual Detections process(const Detections& detections, SourceId source_id = 0) = 0;

    /// Drop every track of one source. Cumulative stats are kept.
    virtual void reset(SourceId source_id) = 0;

    /// Drop the tracks of every source. Cumulative stats are kept.
    virtual void reset_all() = 0;

    /// Zero the cumulative counters of one source; tracks are kept
    virtual void reset_stats(SourceId source_id) = 0;

    /// Snapshot of one source's counters; zeroed for unknown sources
    virtual StabilizationStats get_stats(SourceId source_id = 0) const = 0;

    virtual std::string name() const = 0;

    void enable() { enabled_.store(true); }
    void disable() { enabled_.store(false); }

    /**
     * Flip the enabled flag without touching any track
     * @return The new state
     */
    bool toggle();

    bool is_enabled() const { return enabled_.load(); }

private:
    std::atomic<bool> enabled_{true};
};

/**
 * Pass-through stabilizer (baseline for comparison)
 */
class NoOpStabilizer : public BaseStabilizer {
public:
    Detections process(const Detections& detections, SourceId source_id = 0) override;
    void reset(SourceId source_id) override;
    void reset_all() override {}
    void reset_stats(SourceId source_id) override;
    StabilizationStats get_stats(SourceId source_id = 0) const override;
    std::string name() const override { return "NoOpStabilizer"; }
};

/**
 * Validate a configuration and create the stabilizer for its mode
 * @throws InvalidConfigError if the configuration is invalid
 */
std::unique_ptr<BaseStabilizer> create_stabilizer(const StabilizationConfig& config);

} // namespace detstab
