// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <detstab/detection.hpp>
#include <detstab/stabilizer.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace detstab {

/**
 * Serialize a stats snapshot into a status/report payload
 */
nlohmann::json stats_to_json(const StabilizationStats& stats, SourceId source_id);

nlohmann::json detection_to_json(const Detection& det);

/**
 * Decode one raw detection from a replay frame entry with keys
 * `class`, `confidence`, `x`, `y`, `width`, `height` and optional `class_id`
 * @throws InvalidDetectionError when a required key is absent or malformed
 */
Detection detection_from_yaml(const YAML::Node& node);

} // namespace detstab
