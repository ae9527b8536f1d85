// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file types.hpp
 * @brief Platform-independent type aliases shared by models and simulations.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace spinsim {

// Unsigned integers - Indices and masks
using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Signed integers - Counts and spin values
using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// Floating-point - Coefficients and energies
using f32 = float;
using f64 = double;

/// Bipolar variable value in {-1, +1}.
using Spin = i8;

/// Dense spin configuration indexed by variable position.
using SpinVector = std::vector<Spin>;

static_assert(sizeof(f64) == 8, "64-bit double required");
static_assert(sizeof(i32) >= 4, "32-bit int minimum required");

} // namespace spinsim
