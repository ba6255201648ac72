// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

/**
 * @file detstab.hpp
 * @brief Main header file for detstab - per-source detection stabilization
 *
 * detstab turns flickering per-frame detections into identity-stable ones:
 * greedy IoU association, dual-threshold confidence hysteresis and
 * gap-tolerant track survival, controllable at runtime.
 *
 * @example
 * @code
 * #include <detstab/detstab.hpp>
 *
 * detstab::StabilizationConfig config;
 * auto stabilizer = detstab::create_stabilizer(config);
 *
 * auto stable = stabilizer->process(raw_detections, source_id);
 * @endcode
 */

#include <detstab/version.hpp>
#include <detstab/errors.hpp>
#include <detstab/detection.hpp>
#include <detstab/config.hpp>
#include <detstab/stabilizer.hpp>
#include <detstab/stabilizers/temporal_hysteresis.hpp>
#include <detstab/report.hpp>
#include <detstab/sink.hpp>
#include <detstab/control/command_registry.hpp>

namespace detstab {

/**
 * @brief Library version information
 */
constexpr const char* version() noexcept {
    return DETSTAB_VERSION_STRING;
}

} // namespace detstab
