// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_simulation.cpp
 * @brief Unit tests for adjacency, history, random source and Metropolis dynamics.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <spinsim/model/domain.hpp>
#include <spinsim/model/energy_model.hpp>
#include <spinsim/sim/adjacency.hpp>
#include <spinsim/sim/history.hpp>
#include <spinsim/sim/label_map.hpp>
#include <spinsim/sim/metropolis.hpp>
#include <spinsim/sim/random_source.hpp>
#include <spinsim/sim/spin_simulation.hpp>
#include <spinsim/utils/errors.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace spinsim;

namespace {

/// Open chain s0 - s1 - ... - s_{n-1} with uniform coupling.
EnergyModel<int> make_chain(int n, double coupling) {
    EnergyModel<int> m;
    for (int i = 0; i + 1 < n; ++i) {
        m.add({i, i + 1}, coupling);
    }
    return m;
}

/// Frustrated mixed-arity model over labels 0..5.
EnergyModel<int> make_frustrated() {
    EnergyModel<int> m;
    m.add({0, 1}, 1.0);
    m.add({1, 2}, 1.0);
    m.add({0, 2}, 1.0);
    m.add({2, 3}, -0.5);
    m.add({3, 4, 5}, 0.7);
    m.add({4}, 0.3);
    m.add({1, 5}, -1.2);
    m.add({0}, -0.1);
    m.set_offset(2.0);
    return m;
}

/// Spin assignment over labels 0..n-1 from the bits of mask (bit set -> -1).
Assignment<int> spins_from_mask(int n, unsigned mask) {
    Assignment<int> s;
    for (int i = 0; i < n; ++i) s[i] = ((mask >> i) & 1u) ? -1 : 1;
    return s;
}

Assignment<int> all_up(int n) {
    return spins_from_mask(n, 0);
}

} // namespace

// -----------------------------------------------------------------------------
// Label map
// -----------------------------------------------------------------------------
TEST_CASE("LabelMap: canonical bidirectional mapping", "[labels]") {
    const auto map = LabelMap<int>::from_list({3, 1, 3, 2});
    REQUIRE(map.size() == 3);
    REQUIRE(map.all_labels() == std::vector<int>{1, 2, 3});
    REQUIRE(map.get_idx(2) == std::optional<u32>{1});
    REQUIRE_FALSE(map.get_idx(7).has_value());
    REQUIRE(map.contains(3));
    REQUIRE(map.get_label(0) == 1);
    REQUIRE_THROWS_AS(map.get_label(3), std::out_of_range);
}

// -----------------------------------------------------------------------------
// Adjacency index
// -----------------------------------------------------------------------------
TEST_CASE("AdjacencyIndex: incidence lists and energies", "[adjacency]") {
    const auto model = make_frustrated();
    const auto labels = LabelMap<int>::from_list(model.variables());
    const AdjacencyIndex adj(index_terms(model, labels));

    REQUIRE(adj.n_vars() == 6);
    REQUIRE(adj.n_terms() == model.size());

    SECTION("degrees match term membership") {
        for (u32 i = 0; i < adj.n_vars(); ++i) {
            const int label = labels.get_label(i);
            std::size_t expected = 0;
            for (const auto& [term, coeff] : model) {
                if (term.contains(label)) ++expected;
            }
            REQUIRE(adj.degree(i) == expected);
            REQUIRE(adj.incident(i).size() == expected);
        }
    }

    SECTION("energy is the model value without offset") {
        for (unsigned mask = 0; mask < 64; ++mask) {
            const auto s = spins_from_mask(6, mask);
            SpinVector v(6);
            for (u32 i = 0; i < 6; ++i) v[i] = static_cast<Spin>(s.at(labels.get_label(i)));
            REQUIRE(adj.energy(v) + model.offset() == Catch::Approx(model.value(s)).margin(1e-12));
        }
    }

    SECTION("batch energies") {
        const std::vector<SpinVector> states{
            SpinVector(6, 1), SpinVector(6, -1), SpinVector{1, -1, 1, -1, 1, -1}};
        const auto e = adj.energies(states);
        REQUIRE(e.size() == 3);
        for (std::size_t k = 0; k < states.size(); ++k) {
            REQUIRE(e[k] == Catch::Approx(adj.energy(states[k])));
        }

        const std::vector<SpinVector> bad{SpinVector(5, 1)};
        REQUIRE_THROWS_AS(adj.energies(bad), std::invalid_argument);
    }

    SECTION("missing label is rejected") {
        const auto partial = LabelMap<int>::from_list({0, 1});
        REQUIRE_THROWS_AS(index_terms(model, partial), std::invalid_argument);
    }

    SECTION("out-of-range variable is rejected") {
        IndexedTerms t;
        t.n_vars = 2;
        t.vars = {0, 2};
        t.offsets = {0, 2};
        t.coeffs = {1.0};
        REQUIRE_THROWS_AS(AdjacencyIndex(std::move(t)), std::out_of_range);
    }
}

// -----------------------------------------------------------------------------
// History buffer & random source
// -----------------------------------------------------------------------------
TEST_CASE("HistoryBuffer: order and eviction", "[history]") {
    HistoryBuffer h(3);
    for (Spin s : {Spin{1}, Spin{-1}, Spin{1}, Spin{-1}}) {
        h.push(SpinVector{s, 1});
    }
    REQUIRE(h.size() == 3);  // first snapshot evicted

    const auto last2 = h.recent(2);
    REQUIRE(last2.size() == 2);
    REQUIRE(last2[0] == SpinVector{1, 1});
    REQUIRE(last2[1] == SpinVector{-1, 1});

    REQUIRE(h.recent(10).size() == 3);
    REQUIRE(h.recent(10).front() == SpinVector{-1, 1});

    h.clear();
    REQUIRE(h.empty());

    HistoryBuffer none(0);
    none.push(SpinVector{1});
    REQUIRE(none.empty());
}

TEST_CASE("RandomSource: seeded streams are reproducible", "[random]") {
    RandomSource a(2024);
    RandomSource b(2024);
    for (int k = 0; k < 100; ++k) {
        const u32 i = a.uniform_index(7);
        REQUIRE(i == b.uniform_index(7));
        REQUIRE(i < 7);
        const double u = a.uniform01();
        REQUIRE(u == b.uniform01());
        REQUIRE(u >= 0.0);
        REQUIRE(u < 1.0);
    }

    a.seed(5);
    b.seed(5);
    REQUIRE(a.uniform01() == b.uniform01());

    REQUIRE(a.uniform_index(1) == 0);
    REQUIRE_THROWS_AS(a.uniform_index(0), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Flip energies
// -----------------------------------------------------------------------------
TEST_CASE("SpinSimulation: local delta equals brute-force difference", "[metropolis]") {
    const auto model = make_frustrated();
    SpinSimulation<int> sim(model);

    for (unsigned mask = 0; mask < 64; ++mask) {
        const auto s = spins_from_mask(6, mask);
        sim.set_state(s);
        REQUIRE(sim.energy() == Catch::Approx(model.value(s)).margin(1e-12));

        for (int label = 0; label < 6; ++label) {
            auto flipped = s;
            flipped[label] = -flipped[label];
            const double expected = model.value(flipped) - model.value(s);
            REQUIRE(sim.flip_delta(label) == Catch::Approx(expected).margin(1e-12));
        }
    }

    REQUIRE_THROWS_AS(sim.flip_delta(42), std::out_of_range);
}

// -----------------------------------------------------------------------------
// Dynamics
// -----------------------------------------------------------------------------
TEST_CASE("SpinSimulation: ferromagnetic chain stays aligned at T = 0", "[metropolis]") {
    SpinSimulation<int> sim(make_chain(4, -1.0), all_up(4));

    const i64 accepted = sim.update(0.0, 10);
    REQUIRE(accepted == 0);
    REQUIRE(sim.state() == all_up(4));
    REQUIRE(sim.energy() == Catch::Approx(-3.0));
}

TEST_CASE("SpinSimulation: T = 0 never increases the energy", "[metropolis]") {
    const auto model = make_frustrated();
    SpinSimulation<int> sim(model, spins_from_mask(6, 0b101101), {.memory = 0, .seed = 17});

    double previous = sim.energy();
    for (int sweep = 0; sweep < 30; ++sweep) {
        sim.update(0.0);
        const double current = sim.energy();
        REQUIRE(current <= previous + 1e-12);
        previous = current;
    }

    // Greedy descent ends in a local minimum
    sim.update(0.0, 50);
    for (int label = 0; label < 6; ++label) {
        REQUIRE(sim.flip_delta(label) > 0.0);
    }
}

TEST_CASE("SpinSimulation: single spin field", "[metropolis]") {
    // E = s0: the only descent is +1 -> -1
    EnergyModel<int> field;
    field.add({0}, 1.0);
    SpinSimulation<int> sim(field, std::nullopt, {.memory = 2, .seed = 1});

    REQUIRE(sim.state().at(0) == 1);
    REQUIRE(sim.update(0.0) == 1);
    REQUIRE(sim.state().at(0) == -1);

    auto past = sim.get_past_states();
    REQUIRE(past.size() == 2);
    REQUIRE(past[0].at(0) == 1);
    REQUIRE(past[1].at(0) == -1);

    REQUIRE(sim.update(0.0) == 0);
    past = sim.get_past_states();
    REQUIRE(past.size() == 3);
    REQUIRE(past[0].at(0) == 1);
    REQUIRE(past[1].at(0) == -1);
    REQUIRE(past[2].at(0) == -1);

    // Third push evicts the oldest snapshot
    sim.update(0.0);
    past = sim.get_past_states();
    REQUIRE(past.size() == 3);
    for (const auto& s : past) {
        REQUIRE(s.at(0) == -1);
    }
}

TEST_CASE("SpinSimulation: get_past_states sizes", "[metropolis][history]") {
    SpinSimulation<int> sim(make_chain(5, -1.0), std::nullopt, {.memory = 4, .seed = 3});
    sim.update(2.0, 10);

    REQUIRE(sim.get_past_states().size() == 5);
    REQUIRE(sim.get_past_states(3).size() == 3);
    REQUIRE(sim.get_past_states(100).size() == 5);
    REQUIRE(sim.get_past_states(1).size() == 1);
    REQUIRE(sim.get_past_states(0).size() == 1);
    REQUIRE(sim.get_past_states(1).front() == sim.state());
    REQUIRE(sim.get_past_states().back() == sim.state());
    REQUIRE(sim.engine().history().size() == 4);
    REQUIRE(sim.label_map().size() == 5);

    SECTION("trajectory energies follow the returned states") {
        const auto model = make_chain(5, -1.0);
        const auto states = sim.get_past_states();
        const auto energies = sim.trajectory_energies();
        REQUIRE(energies.size() == states.size());
        for (std::size_t k = 0; k < states.size(); ++k) {
            REQUIRE(energies[k] == Catch::Approx(model.value(states[k])));
        }
    }
}

TEST_CASE("SpinSimulation: memory 0 keeps only the current state", "[metropolis][history]") {
    SpinSimulation<int> sim(make_frustrated(), std::nullopt, {.seed = 8});
    REQUIRE(sim.memory() == 0);

    for (int k = 0; k < 5; ++k) {
        sim.update(1.5, 3);
        const auto past = sim.get_past_states();
        REQUIRE(past.size() == 1);
        REQUIRE(past.front() == sim.state());
        REQUIRE(sim.get_past_states(10).size() == 1);
    }
}

TEST_CASE("SpinSimulation: reset restores the constructed state", "[metropolis]") {
    const auto initial = spins_from_mask(6, 0b010011);
    SpinSimulation<int> sim(make_frustrated(), initial, {.memory = 5, .seed = 21});
    const auto fresh_past = sim.get_past_states();

    sim.update(3.0, 12);
    sim.reset();
    REQUIRE(sim.state() == initial);
    REQUIRE(sim.initial_state() == initial);
    REQUIRE(sim.get_past_states() == fresh_past);
    REQUIRE(sim.get_past_states().size() == 1);

    sim.reset();
    REQUIRE(sim.state() == initial);
    REQUIRE(sim.get_past_states() == fresh_past);
}

TEST_CASE("SpinSimulation: determinism under seeding", "[metropolis][random]") {
    const auto model = make_frustrated();

    SECTION("same construction seed") {
        SpinSimulation<int> a(model, std::nullopt, {.memory = 8, .seed = 123});
        SpinSimulation<int> b(model, std::nullopt, {.memory = 8, .seed = 123});
        REQUIRE(a.update(1.0, 10) == b.update(1.0, 10));
        REQUIRE(a.update(0.5, 4) == b.update(0.5, 4));
        REQUIRE(a.get_past_states() == b.get_past_states());
    }

    SECTION("per-call seed overrides construction seed") {
        SpinSimulation<int> a(model, std::nullopt, {.memory = 8, .seed = 1});
        SpinSimulation<int> b(model, std::nullopt, {.memory = 8, .seed = 2});
        a.update(2.0, 6, 99);
        b.update(2.0, 6, 99);
        REQUIRE(a.get_past_states() == b.get_past_states());
    }

    SECTION("seeding one simulation leaves another untouched") {
        SpinSimulation<int> a(model, std::nullopt, {.memory = 8, .seed = 5});
        SpinSimulation<int> b(model, std::nullopt, {.memory = 8, .seed = 5});
        SpinSimulation<int> other(model, std::nullopt, {.seed = 5});
        a.update(2.0, 3);
        other.update(2.0, 7, 1234);
        b.update(2.0, 3);
        REQUIRE(a.get_past_states() == b.get_past_states());
    }
}

TEST_CASE("SpinSimulation: schedule equals the update sequence", "[metropolis]") {
    const auto model = make_frustrated();
    SpinSimulation<int> a(model, std::nullopt, {.memory = 20, .seed = 0});
    SpinSimulation<int> b(model, std::nullopt, {.memory = 20, .seed = 0});

    const std::vector<Phase> schedule{{4.0, 3}, {1.0, 2}, {0.0, 4}};
    const i64 total = a.schedule_update(schedule, 11);

    i64 expected = b.update(4.0, 3, 11);
    expected += b.update(1.0, 2);
    expected += b.update(0.0, 4);

    REQUIRE(total == expected);
    REQUIRE(a.state() == b.state());
    REQUIRE(a.get_past_states() == b.get_past_states());
    REQUIRE(a.get_past_states().size() == 10);
}

// -----------------------------------------------------------------------------
// Errors
// -----------------------------------------------------------------------------
TEST_CASE("SpinSimulation: invalid arguments", "[metropolis][errors]") {
    const auto model = make_chain(3, -1.0);

    SECTION("initial state values") {
        auto bad = all_up(3);
        bad[1] = 0;
        REQUIRE_THROWS_AS(SpinSimulation<int>(model, bad), InvalidStateValue);

        auto missing = all_up(3);
        missing.erase(2);
        REQUIRE_THROWS_AS(SpinSimulation<int>(model, missing), InvalidStateValue);

        // Labels outside the model are ignored
        auto extra = all_up(3);
        extra[99] = 5;
        SpinSimulation<int> sim(model, extra);
        REQUIRE(sim.state() == all_up(3));
    }

    SpinSimulation<int> sim(model, std::nullopt, {.memory = 3, .seed = 4});

    SECTION("set_state validates and keeps the old state") {
        auto bad = all_up(3);
        bad[0] = 2;
        REQUIRE_THROWS_AS(sim.set_state(bad), InvalidStateValue);
        REQUIRE(sim.state() == all_up(3));
    }

    SECTION("negative temperature") {
        REQUIRE_THROWS_AS(sim.update(-1.0), InvalidScheduleEntry);
        REQUIRE_THROWS_AS(sim.update(std::numeric_limits<double>::quiet_NaN()),
                          InvalidScheduleEntry);
        REQUIRE(sim.get_past_states().size() == 1);
    }

    SECTION("negative sweep count") {
        REQUIRE_THROWS_AS(sim.update(1.0, -1), InvalidUpdateCount);
        REQUIRE(sim.get_past_states().size() == 1);
    }

    SECTION("zero sweeps is a no-op") {
        REQUIRE(sim.update(1.0, 0) == 0);
        REQUIRE(sim.get_past_states().size() == 1);
    }

    SECTION("schedule validates every phase first") {
        const std::vector<Phase> schedule{{1.0, 2}, {-0.5, 1}};
        REQUIRE_THROWS_AS(sim.schedule_update(schedule), InvalidScheduleEntry);

        const std::vector<Phase> negative{{1.0, 2}, {1.0, -3}};
        REQUIRE_THROWS_AS(sim.schedule_update(negative), InvalidUpdateCount);

        REQUIRE(sim.get_past_states().size() == 1);
        REQUIRE(sim.state() == all_up(3));
    }

    SECTION("errors are invalid_argument") {
        REQUIRE_THROWS_AS(sim.update(-2.0), std::invalid_argument);
    }
}

TEST_CASE("SpinSimulation: labels and description", "[metropolis]") {
    EnergyModel<std::string> m;
    m.add(Term<std::string>{"a", "b"}, -1.0);
    m.add(Term<std::string>{"c"}, 0.5);

    SpinSimulation<std::string> sim(m, std::nullopt, {.memory = 5});
    REQUIRE(sim.variables() == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(sim.memory() == 5);
    REQUIRE(sim.describe() == "SpinSimulation(memory=5)");
    REQUIRE(sim.energy() == Catch::Approx(-0.5));

    sim.update(0.0, 30, 7);
    REQUIRE(sim.state().at("c") == -1);
    REQUIRE(sim.state().at("a") == sim.state().at("b"));
}

TEST_CASE("SpinSimulation: empty model", "[metropolis]") {
    EnergyModel<int> constant;
    constant.set_offset(1.5);

    SpinSimulation<int> sim(constant, std::nullopt, {.memory = 2});
    REQUIRE(sim.variables().empty());
    REQUIRE(sim.update(1.0, 5) == 0);
    REQUIRE(sim.energy() == 1.5);
    REQUIRE(sim.get_past_states().size() == 3);
}
