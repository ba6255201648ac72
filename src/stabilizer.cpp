// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/stabilizer.hpp>
#include <detstab/stabilizers/temporal_hysteresis.hpp>
#include <detstab/matching/matcher.hpp>
#include <iostream>

namespace detstab {

bool BaseStabilizer::toggle() {
    bool current = enabled_.load();
    while (!enabled_.compare_exchange_weak(current, !current)) {
    }
    return !current;
}

// ============================================================================
// NoOpStabilizer
// ============================================================================

Detections NoOpStabilizer::process(const Detections& detections, SourceId /* source_id */) {
    return detections;
}

void NoOpStabilizer::reset(SourceId /* source_id */) {
}

void NoOpStabilizer::reset_stats(SourceId /* source_id */) {
}

StabilizationStats NoOpStabilizer::get_stats(SourceId /* source_id */) const {
    StabilizationStats stats;
    stats.mode = to_string(StabilizationMode::None);
    stats.enabled = is_enabled();
    return stats;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<BaseStabilizer> create_stabilizer(const StabilizationConfig& config) {
    config.validate();

    if (config.mode == StabilizationMode::None) {
        if (config.verbose) {
            std::clog << "Stabilization: none (pass-through)" << std::endl;
        }
        return std::make_unique<NoOpStabilizer>();
    }

    return std::make_unique<stabilizers::TemporalHysteresisStabilizer>(
        config, matching::create_matcher(config));
}

} // namespace detstab
