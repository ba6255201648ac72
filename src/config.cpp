// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#include <detstab/config.hpp>
#include <detstab/errors.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace detstab {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void check_unit_interval(const char* key, float value) {
    if (!(value >= 0.0f && value <= 1.0f)) {
        std::ostringstream oss;
        oss << key << " must be in [0.0, 1.0], got " << value;
        throw InvalidConfigError(oss.str());
    }
}

// Read a scalar, reporting type errors as configuration errors
template<typename T>
void read(const YAML::Node& parent, const char* key, const char* path, T& out) {
    if (!parent.IsMap()) {
        throw InvalidConfigError(std::string("Expected a map around ") + path);
    }
    const YAML::Node value = parent[key];
    if (!value) {
        return;
    }
    try {
        out = value.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidConfigError(std::string("Invalid value for ") + path + ": " + e.what());
    }
}

} // namespace

void StabilizationConfig::validate() const {
    if (min_frames < 1) {
        throw InvalidConfigError("min_frames must be >= 1, got " + std::to_string(min_frames));
    }
    if (max_gap < 0) {
        throw InvalidConfigError("max_gap must be >= 0, got " + std::to_string(max_gap));
    }
    check_unit_interval("appear_confidence", appear_confidence);
    check_unit_interval("persist_confidence", persist_confidence);
    check_unit_interval("iou_threshold", iou_threshold);
    if (persist_confidence > appear_confidence) {
        std::ostringstream oss;
        oss << "persist_confidence (" << persist_confidence
            << ") must be <= appear_confidence (" << appear_confidence << ")";
        throw InvalidConfigError(oss.str());
    }
    if (history_size < 1) {
        throw InvalidConfigError("history_size must be >= 1, got " + std::to_string(history_size));
    }
}

StabilizationConfig stabilization_config_from_yaml(const YAML::Node& root) {
    StabilizationConfig config;

    const bool nested = root.IsMap() && root["detection_stabilization"];
    const YAML::Node section = nested ? root["detection_stabilization"] : root;
    if (!section || section.IsNull()) {
        config.validate();
        return config;
    }
    if (!section.IsMap()) {
        throw InvalidConfigError("detection_stabilization must be a map");
    }

    std::string mode = to_string(config.mode);
    read(section, "mode", "mode", mode);
    config.mode = parse_mode(mode);

    if (const YAML::Node temporal = section["temporal"]) {
        read(temporal, "min_frames", "temporal.min_frames", config.min_frames);
        read(temporal, "max_gap", "temporal.max_gap", config.max_gap);
    }

    if (const YAML::Node hysteresis = section["hysteresis"]) {
        read(hysteresis, "appear_confidence", "hysteresis.appear_confidence", config.appear_confidence);
        read(hysteresis, "persist_confidence", "hysteresis.persist_confidence", config.persist_confidence);
    }

    if (const YAML::Node iou = section["iou"]) {
        read(iou, "threshold", "iou.threshold", config.iou_threshold);
    }

    std::string matching = to_string(config.matching);
    read(section, "matching", "matching", matching);
    config.matching = parse_matching(matching);

    read(section, "history_size", "history_size", config.history_size);
    read(section, "verbose", "verbose", config.verbose);

    config.validate();
    return config;
}

StabilizationConfig load_stabilization_config(const std::string& config_path) {
    if (!std::filesystem::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    YAML::Node yaml_config = YAML::LoadFile(config_path);
    return stabilization_config_from_yaml(yaml_config);
}

std::string to_string(StabilizationMode mode) {
    switch (mode) {
        case StabilizationMode::None: return "none";
        case StabilizationMode::Temporal: return "temporal";
    }
    return "unknown";
}

std::string to_string(MatchingStrategy strategy) {
    switch (strategy) {
        case MatchingStrategy::IoU: return "iou";
        case MatchingStrategy::ClassOnly: return "class_only";
    }
    return "unknown";
}

StabilizationMode parse_mode(const std::string& name) {
    const std::string key = lower(name);
    if (key == "none") {
        return StabilizationMode::None;
    }
    if (key == "temporal") {
        return StabilizationMode::Temporal;
    }
    throw InvalidConfigError("Invalid stabilization mode: '" + name +
                             "'. Supported: 'none', 'temporal'");
}

MatchingStrategy parse_matching(const std::string& name) {
    const std::string key = lower(name);
    if (key == "iou") {
        return MatchingStrategy::IoU;
    }
    if (key == "class_only") {
        return MatchingStrategy::ClassOnly;
    }
    throw InvalidConfigError("Invalid matching strategy: '" + name +
                             "'. Supported: 'iou', 'class_only'");
}

} // namespace detstab
