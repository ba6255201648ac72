// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <string>
#include <yaml-cpp/yaml.h>

namespace detstab {

/**
 * Stabilization modes
 */
enum class StabilizationMode {
    None = 0,      // pass-through baseline
    Temporal = 1   // temporal filtering + confidence hysteresis
};

/**
 * Detection-to-track matching strategies
 */
enum class MatchingStrategy {
    IoU = 0,
    ClassOnly = 1
};

/**
 * Stabilization configuration parameters.
 * Immutable once handed to a stabilizer; never re-read after construction.
 */
struct StabilizationConfig {
    StabilizationMode mode = StabilizationMode::Temporal;
    int min_frames = 3;                // consecutive accepted matches to confirm
    int max_gap = 2;                   // tolerated frames without a match
    float appear_confidence = 0.5f;    // threshold to create / re-validate
    float persist_confidence = 0.3f;   // threshold to keep a confirmed track
    float iou_threshold = 0.3f;        // strict lower bound for a spatial match
    MatchingStrategy matching = MatchingStrategy::IoU;
    int history_size = 10;             // bounded confidence history per track
    bool verbose = false;

    /**
     * Check every constraint
     * @throws InvalidConfigError naming the offending field
     */
    void validate() const;
};

/**
 * Build a configuration from a YAML node. Accepts either a document with a
 * top-level `detection_stabilization` key or the section itself.
 * Missing keys keep their defaults. The result is validated.
 */
StabilizationConfig stabilization_config_from_yaml(const YAML::Node& node);

/**
 * Load stabilization configuration from YAML file
 */
StabilizationConfig load_stabilization_config(const std::string& config_path);

std::string to_string(StabilizationMode mode);
std::string to_string(MatchingStrategy strategy);

/**
 * Parse a mode name ("none", "temporal"), case-insensitive
 * @throws InvalidConfigError for unknown names
 */
StabilizationMode parse_mode(const std::string& name);

/**
 * Parse a matching strategy name ("iou", "class_only"), case-insensitive
 * @throws InvalidConfigError for unknown names
 */
MatchingStrategy parse_matching(const std::string& name);

} // namespace detstab
