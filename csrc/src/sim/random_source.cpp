// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file random_source.cpp
 * @brief Engine-owned pseudo-random source.
 */

#include <spinsim/sim/random_source.hpp>

#include <stdexcept>

namespace spinsim {

RandomSource::RandomSource() {
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    rng_.seed(seq);
}

RandomSource::RandomSource(u64 seed) : rng_(seed) {}

void RandomSource::seed(u64 seed) {
    rng_.seed(seed);
}

u32 RandomSource::uniform_index(u32 n) {
    if (n == 0) {
        throw std::invalid_argument("RandomSource::uniform_index: empty range");
    }
    std::uniform_int_distribution<u32> dist(0, n - 1);
    return dist(rng_);
}

double RandomSource::uniform01() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_);
}

} // namespace spinsim
