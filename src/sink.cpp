// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/sink.hpp>
#include <stdexcept>
#include <utility>

namespace detstab {

StabilizationSink::StabilizationSink(BaseStabilizer& stabilizer, PredictionSink downstream)
    : stabilizer_(stabilizer)
    , downstream_(std::move(downstream))
{
    if (!downstream_) {
        throw std::invalid_argument("StabilizationSink requires a downstream sink");
    }
}

void StabilizationSink::operator()(const FramePredictions& frame) const {
    FramePredictions stabilized;
    stabilized.source_id = frame.source_id;
    stabilized.frame_id = frame.frame_id;
    stabilized.detections = stabilizer_.process(frame.detections, frame.source_id);
    stabilized.stats = stabilizer_.get_stats(frame.source_id);

    downstream_(stabilized);
}

} // namespace detstab
