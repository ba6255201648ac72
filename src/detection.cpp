// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/detection.hpp>
#include <detstab/errors.hpp>
#include <cmath>
#include <sstream>

namespace detstab {

void validate_detection(const Detection& det) {
    if (det.class_name.empty()) {
        throw InvalidDetectionError("Detection is missing its class label");
    }

    if (!std::isfinite(det.confidence)) {
        throw InvalidDetectionError("Detection '" + det.class_name + "' is missing its confidence");
    }

    if (det.confidence < 0.0f || det.confidence > 1.0f) {
        std::ostringstream oss;
        oss << "Detection '" << det.class_name << "' confidence " << det.confidence
            << " is outside [0, 1]";
        throw InvalidDetectionError(oss.str());
    }

    const BoundingBox& b = det.box;
    if (!std::isfinite(b.x) || !std::isfinite(b.y) ||
        !std::isfinite(b.width) || !std::isfinite(b.height)) {
        throw InvalidDetectionError("Detection '" + det.class_name + "' is missing its bounding box");
    }

    if (b.width < 0.0f || b.height < 0.0f) {
        throw InvalidDetectionError("Detection '" + det.class_name + "' has a negative box size");
    }
}

} // namespace detstab
