// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 detstab contributors

#pragma once

#include <stdexcept>
#include <string>

namespace detstab {

/**
 * Raised at construction time when a StabilizationConfig violates its
 * constraints. A stabilizer is never created from an invalid config.
 */
class InvalidConfigError : public std::invalid_argument {
public:
    explicit InvalidConfigError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * Raised for a single raw detection that is missing a required field or
 * carries an out-of-range confidence. Recoverable: the batch continues.
 */
class InvalidDetectionError : public std::invalid_argument {
public:
    explicit InvalidDetectionError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * Raised by the command registry for a command that is not registered
 */
class CommandNotAvailableError : public std::runtime_error {
public:
    explicit CommandNotAvailableError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace detstab
