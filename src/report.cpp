// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/report.hpp>
#include <detstab/errors.hpp>

namespace detstab {

namespace {

template<typename T>
T required(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) {
        throw InvalidDetectionError(std::string("Detection is missing required field '") + key + "'");
    }
    try {
        return value.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidDetectionError(std::string("Detection field '") + key + "' is malformed: " + e.what());
    }
}

} // namespace

using json = nlohmann::json;

json stats_to_json(const StabilizationStats& stats, SourceId source_id) {
    json j;
    j["source_id"] = source_id;
    j["mode"] = stats.mode;
    j["enabled"] = stats.enabled;
    j["total_detected"] = stats.total_detected;
    j["total_confirmed"] = stats.total_confirmed;
    j["total_ignored"] = stats.total_ignored;
    j["total_removed"] = stats.total_removed;
    j["total_invalid"] = stats.total_invalid;
    j["active_tracks"] = stats.active_tracks;
    j["confirm_ratio"] = stats.confirm_ratio();

    j["tracks_by_class"] = json::object();
    for (const auto& [cls, count] : stats.tracks_by_class) {
        j["tracks_by_class"][cls] = count;
    }
    return j;
}

json detection_to_json(const Detection& det) {
    json j;
    j["class"] = det.class_name;
    j["confidence"] = det.confidence;
    j["x"] = det.box.x;
    j["y"] = det.box.y;
    j["width"] = det.box.width;
    j["height"] = det.box.height;
    if (det.class_id) {
        j["class_id"] = *det.class_id;
    }
    if (det.stabilization) {
        j["stabilization"] = {
            {"track_id", det.stabilization->track_id},
            {"avg_confidence", det.stabilization->avg_confidence},
            {"frames_tracked", det.stabilization->frames_tracked}
        };
    }
    return j;
}

Detection detection_from_yaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw InvalidDetectionError("Detection entry must be a map");
    }

    Detection det;
    det.class_name = required<std::string>(node, "class");
    det.confidence = required<float>(node, "confidence");
    det.box.x = required<float>(node, "x");
    det.box.y = required<float>(node, "y");
    det.box.width = required<float>(node, "width");
    det.box.height = required<float>(node, "height");
    if (node["class_id"] && !node["class_id"].IsNull()) {
        det.class_id = required<int>(node, "class_id");
    }

    validate_detection(det);
    return det;
}

} // namespace detstab
