// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace detstab {

/// Identifier of one independent input stream (e.g. one camera)
using SourceId = int;

/// Track identifier, unique within a source's lifetime
using TrackId = int;

/**
 * Axis-aligned bounding box in center form.
 * (x, y) is the box center; units are whatever the caller uses
 * (normalized or pixels) as long as a frame does not mix them.
 */
struct BoundingBox {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    float area() const { return width * height; }
};

inline bool operator==(const BoundingBox& a, const BoundingBox& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}

/**
 * Tracking metadata attached to every detection emitted by the stabilizer
 */
struct StabilizationInfo {
    TrackId track_id = -1;
    float avg_confidence = 0.0f;
    int frames_tracked = 0;
};

inline bool operator==(const StabilizationInfo& a, const StabilizationInfo& b) {
    return a.track_id == b.track_id && a.avg_confidence == b.avg_confidence &&
           a.frames_tracked == b.frames_tracked;
}

/**
 * One object detection. Raw detections arrive unordered and carry no
 * identity; stabilized detections additionally carry StabilizationInfo.
 * Confidence and box start out NaN so that unset fields fail validation.
 */
struct Detection {
    static constexpr float kUnset = std::numeric_limits<float>::quiet_NaN();

    std::string class_name;
    float confidence = kUnset;
    BoundingBox box{kUnset, kUnset, kUnset, kUnset};
    std::optional<int> class_id;
    std::optional<StabilizationInfo> stabilization;

    Detection() = default;
    Detection(std::string cls, float conf, const BoundingBox& bbox,
              std::optional<int> cls_id = std::nullopt)
        : class_name(std::move(cls))
        , confidence(conf)
        , box(bbox)
        , class_id(cls_id) {}
};

inline bool operator==(const Detection& a, const Detection& b) {
    return a.class_name == b.class_name && a.confidence == b.confidence &&
           a.box == b.box && a.class_id == b.class_id &&
           a.stabilization == b.stabilization;
}

inline bool operator!=(const Detection& a, const Detection& b) { return !(a == b); }

using Detections = std::vector<Detection>;

/**
 * Check that a raw detection has every required field and a confidence
 * in [0, 1].
 * @throws InvalidDetectionError describing the first violation found
 */
void validate_detection(const Detection& det);

} // namespace detstab
