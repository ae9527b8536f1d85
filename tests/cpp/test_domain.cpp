// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_domain.cpp
 * @brief Unit tests for value maps and PUBO <-> PUSO model conversion.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <spinsim/model/domain.hpp>
#include <spinsim/model/energy_model.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace spinsim;

namespace {

/// Every Boolean assignment over the given labels.
template<typename L>
std::vector<Assignment<L>> all_boolean_states(const std::vector<L>& labels) {
    std::vector<Assignment<L>> out;
    const u64 n = labels.size();
    for (u64 mask = 0; mask < (u64{1} << n); ++mask) {
        Assignment<L> a;
        for (u64 i = 0; i < n; ++i) a[labels[i]] = static_cast<int>((mask >> i) & 1);
        out.push_back(std::move(a));
    }
    return out;
}

} // namespace

// -----------------------------------------------------------------------------
// Value maps
// -----------------------------------------------------------------------------
TEST_CASE("Domain: value maps", "[domain]") {
    STATIC_REQUIRE(spin_to_boolean(1) == 0);
    STATIC_REQUIRE(spin_to_boolean(-1) == 1);
    STATIC_REQUIRE(boolean_to_spin(0) == 1);
    STATIC_REQUIRE(boolean_to_spin(1) == -1);

    REQUIRE(is_valid_value(Domain::Spin, -1));
    REQUIRE_FALSE(is_valid_value(Domain::Spin, 0));
    REQUIRE(is_valid_value(Domain::Boolean, 0));
    REQUIRE_FALSE(is_valid_value(Domain::Boolean, -1));
    REQUIRE(domain_name(Domain::Boolean) == "boolean");

    const Assignment<int> s{{0, 1}, {1, -1}};
    const auto b = spin_to_boolean(s);
    REQUIRE(b.at(0) == 0);
    REQUIRE(b.at(1) == 1);
    REQUIRE(boolean_to_spin(b) == s);
}

// -----------------------------------------------------------------------------
// Model conversion
// -----------------------------------------------------------------------------
TEST_CASE("Domain: single-variable conversion", "[domain]") {
    EnergyModel<int> pubo;
    pubo.add({7}, 1.0);

    // b = (1 - s)/2
    const auto puso = pubo_to_puso(pubo);
    REQUIRE(puso.size() == 1);
    REQUIRE(puso.get({7}) == Catch::Approx(-0.5));
    REQUIRE(puso.offset() == Catch::Approx(0.5));

    const auto back = puso_to_pubo(puso);
    REQUIRE(back.size() == 1);
    REQUIRE(back.get({7}) == Catch::Approx(1.0));
    REQUIRE(back.offset() == Catch::Approx(0.0));
}

TEST_CASE("Domain: conversion preserves objective values", "[domain]") {
    EnergyModel<int> pubo;
    pubo.add({0}, 1.5);
    pubo.add({0, 1}, -2.0);
    pubo.add({1, 2, 3}, 3.0);
    pubo.add({0, 2}, 0.75);
    pubo.add({3}, -1.0);
    pubo.set_offset(4.0);

    const auto puso = pubo_to_puso(pubo);
    REQUIRE(puso.degree() == 3);

    const auto labels = pubo.variables();
    for (const auto& b : all_boolean_states(labels)) {
        REQUIRE(puso.value(boolean_to_spin(b)) == Catch::Approx(pubo.value(b)));
    }

    SECTION("spin -> boolean") {
        EnergyModel<int> spin_model;
        spin_model.add({0, 1}, -1.0);
        spin_model.add({1, 2, 3}, 0.5);
        spin_model.add({2}, 2.0);
        spin_model.set_offset(-1.0);

        const auto b_model = puso_to_pubo(spin_model);
        for (const auto& b : all_boolean_states(spin_model.variables())) {
            REQUIRE(b_model.value(b) == Catch::Approx(spin_model.value(boolean_to_spin(b))));
        }
    }

    SECTION("round trip recovers coefficients") {
        const auto back = puso_to_pubo(puso);
        REQUIRE(back.size() == pubo.size());
        for (const auto& [term, coeff] : pubo) {
            REQUIRE(back.get(term) == Catch::Approx(coeff));
        }
        REQUIRE(back.offset() == Catch::Approx(pubo.offset()));
    }
}

TEST_CASE("Domain: cancelled variables vanish", "[domain]") {
    // b0 b1 = (1 - s0 - s1 + s0 s1)/4, and -b0/2 - b1/2 contributes +s0/4 + s1/4
    EnergyModel<int> pubo;
    pubo.add({0, 1}, 1.0);
    pubo.add({0}, -0.5);
    pubo.add({1}, -0.5);

    const auto puso = pubo_to_puso(pubo);
    REQUIRE(puso.size() == 1);
    REQUIRE(puso.get({0, 1}) == Catch::Approx(0.25));
    REQUIRE(puso.offset() == Catch::Approx(-0.25));
}

TEST_CASE("Domain: string labels convert", "[domain]") {
    EnergyModel<std::string> pubo;
    pubo.add(Term<std::string>{"a", "b"}, 2.0);

    const auto puso = pubo_to_puso(pubo);
    REQUIRE(puso.size() == 3);
    REQUIRE(puso.get(Term<std::string>{"a"}) == Catch::Approx(-0.5));
    REQUIRE(puso.get(Term<std::string>{"b", "a"}) == Catch::Approx(0.5));
    REQUIRE(puso.offset() == Catch::Approx(0.5));
}
