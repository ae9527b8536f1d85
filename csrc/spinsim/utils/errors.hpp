// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file errors.hpp
 * @brief Exception taxonomy for model construction and simulation control.
 *
 * All errors are raised synchronously, before any state is mutated, and
 * indicate caller bugs rather than recoverable runtime conditions. Each type
 * derives from std::invalid_argument so generic handlers still apply.
 */

#pragma once

#include <stdexcept>

namespace spinsim {

/// Empty term, repeated label within a term, or equal indices in a coupling.
class InvalidTerm : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Assignment value outside the variable domain, or a missing variable.
class InvalidStateValue : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Negative number of sweeps.
class InvalidUpdateCount : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Negative (or NaN) temperature in an update or schedule phase.
class InvalidScheduleEntry : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace spinsim
