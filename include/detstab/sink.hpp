// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <detstab/stabilizer.hpp>
#include <cstdint>
#include <functional>
#include <optional>

namespace detstab {

/**
 * One frame's predictions as handed between pipeline stages
 */
struct FramePredictions {
    SourceId source_id = 0;
    int64_t frame_id = 0;
    Detections detections;
    std::optional<StabilizationStats> stats;
};

using PredictionSink = std::function<void(const FramePredictions&)>;

/**
 * Adapter placing a stabilizer in front of a downstream sink.
 * The stabilizer stays unaware of the sink; this class only composes them.
 */
class StabilizationSink {
public:
    StabilizationSink(BaseStabilizer& stabilizer, PredictionSink downstream);

    /// Stabilize the frame, attach a stats snapshot and forward it
    void operator()(const FramePredictions& frame) const;

private:
    BaseStabilizer& stabilizer_;
    PredictionSink downstream_;
};

} // namespace detstab
