// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/matching/matcher.hpp>
#include <detstab/utils/iou.hpp>
#include <detstab/utils/ops.hpp>
#include <algorithm>
#include <numeric>
#include <unordered_set>

namespace detstab::matching {

// ============================================================================
// Matcher
// ============================================================================

Assignment Matcher::match(const Detections& detections, const TrackRegistry& registry) const {
    Assignment result;
    result.track_for_detection.assign(detections.size(), std::nullopt);

    // Highest confidence first; stable so equal confidences keep input order
    std::vector<size_t> order(detections.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return detections[a].confidence > detections[b].confidence;
    });

    std::unordered_set<TrackId> matched;
    std::vector<const Track*> candidates;

    for (size_t det_idx : order) {
        const Detection& det = detections[det_idx];

        candidates.clear();
        for (const auto& track : registry.bucket(det.class_name)) {
            if (matched.count(track.id()) == 0) {
                candidates.push_back(&track);
            }
        }
        if (candidates.empty()) {
            continue;
        }

        int best = select(det, candidates);
        if (best >= 0) {
            const TrackId id = candidates[static_cast<size_t>(best)]->id();
            matched.insert(id);
            result.track_for_detection[det_idx] = id;
        }
    }

    for (TrackId id : registry.ids()) {
        if (matched.count(id) == 0) {
            result.unmatched_tracks.push_back(id);
        }
    }

    return result;
}

// ============================================================================
// IoUMatcher
// ============================================================================

IoUMatcher::IoUMatcher(float iou_threshold)
    : iou_threshold_(iou_threshold)
{
}

int IoUMatcher::select(const Detection& det,
                       const std::vector<const Track*>& candidates) const {
    std::vector<BoundingBox> boxes;
    boxes.reserve(candidates.size());
    for (const Track* track : candidates) {
        boxes.push_back(track->box());
    }

    Eigen::MatrixXf iou = utils::iou_batch(utils::boxes_to_xyxy({det.box}),
                                           utils::boxes_to_xyxy(boxes));

    // Strict comparison keeps the earliest-created track on ties
    int best = -1;
    float best_iou = 0.0f;
    for (Eigen::Index j = 0; j < iou.cols(); ++j) {
        if (best < 0 || iou(0, j) > best_iou) {
            best = static_cast<int>(j);
            best_iou = iou(0, j);
        }
    }

    return (best >= 0 && best_iou > iou_threshold_) ? best : -1;
}

// ============================================================================
// ClassOnlyMatcher
// ============================================================================

int ClassOnlyMatcher::select(const Detection& /* det */,
                             const std::vector<const Track*>& candidates) const {
    return candidates.empty() ? -1 : 0;
}

std::unique_ptr<Matcher> create_matcher(const StabilizationConfig& config) {
    switch (config.matching) {
        case MatchingStrategy::ClassOnly:
            return std::make_unique<ClassOnlyMatcher>();
        case MatchingStrategy::IoU:
            break;
    }
    return std::make_unique<IoUMatcher>(config.iou_threshold);
}

} // namespace detstab::matching
