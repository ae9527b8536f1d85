// Copyright 2025 The SpinSim Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bridge.cpp
 * @brief Python-C++ nanobind bridge for SpinSim.
 *
 * Provides Python bindings for:
 *  - Spin / Boolean Metropolis simulations over integer labels
 *  - PUBO <-> PUSO model conversion
 *
 * Models cross the boundary as dicts {tuple_of_labels: coefficient}; the
 * empty tuple carries the constant offset. States are dicts {label: value}.
 */

#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

#include <spinsim/model/domain.hpp>
#include <spinsim/model/energy_model.hpp>
#include <spinsim/sim/boolean_simulation.hpp>
#include <spinsim/sim/metropolis.hpp>
#include <spinsim/sim/spin_simulation.hpp>

#include <cstdint>
#include <cstring>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

using spinsim::i64;
using spinsim::u64;
using spinsim::Phase;
using spinsim::SimOptions;

using Label      = std::int64_t;
using Model      = spinsim::EnergyModel<Label>;
using State      = spinsim::Assignment<Label>;
using SpinSim    = spinsim::SpinSimulation<Label>;
using BooleanSim = spinsim::BooleanSimulation<Label>;
using F64VecOut  = nb::ndarray<double, nb::numpy, nb::shape<-1>>;

// Python ↔ C++ conversion utilities
[[nodiscard]] inline Model to_model(const nb::dict& d) {
    Model model;
    for (auto [key, value] : d) {
        auto labels = nb::cast<std::vector<Label>>(key);
        const double coeff = nb::cast<double>(value);
        if (labels.empty()) {
            model.add_offset(coeff);
        } else {
            model.add(spinsim::Term<Label>(std::move(labels)), coeff);
        }
    }
    return model;
}

[[nodiscard]] inline nb::dict from_model(const Model& model) {
    nb::dict d;
    if (model.offset() != 0.0) {
        d[nb::make_tuple()] = model.offset();
    }
    for (const auto& [term, coeff] : model) {
        nb::list labels;
        for (Label v : term) labels.append(v);
        d[nb::steal<nb::tuple>(PySequence_Tuple(labels.ptr()))] = coeff;
    }
    return d;
}

[[nodiscard]] inline std::vector<Phase> to_phases(
    const std::vector<std::pair<double, i64>>& schedule) {
    std::vector<Phase> out;
    out.reserve(schedule.size());
    for (const auto& [T, n] : schedule) {
        out.push_back(Phase{T, n});
    }
    return out;
}

[[nodiscard]] inline F64VecOut from_double_vector(const std::vector<double>& xs) {
    const size_t N = xs.size();
    auto* data = new double[N];
    std::memcpy(data, xs.data(), N * sizeof(double));
    nb::capsule owner(data, [](void* p) noexcept {
        delete[] static_cast<double*>(p);
    });
    return F64VecOut(data, {N}, owner);
}

/// Bind the shared simulation surface of SpinSimulation / BooleanSimulation.
template<class Sim>
void bind_simulation(nb::module_& m, const char* name, const char* doc) {
    nb::class_<Sim>(m, name, doc)
        .def("__init__",
             [](Sim* self, const nb::dict& model, std::optional<State> initial_state,
                size_t memory, std::optional<u64> seed) {
                 new (self) Sim(to_model(model), std::move(initial_state),
                                SimOptions{.memory = memory, .seed = seed});
             },
             "model"_a, "initial_state"_a = nb::none(), "memory"_a = 0,
             "seed"_a = nb::none())
        .def_prop_ro("state", &Sim::state)
        .def_prop_ro("initial_state", &Sim::initial_state)
        .def_prop_ro("memory", &Sim::memory)
        .def_prop_ro("variables", &Sim::variables)
        .def("set_state", &Sim::set_state, "state"_a)
        .def("update", &Sim::update, "T"_a, "num_updates"_a = 1, "seed"_a = nb::none(),
             "Run num_updates sweeps at temperature T; returns accepted flips.")
        .def("schedule_update",
             [](Sim& self, const std::vector<std::pair<double, i64>>& schedule,
                std::optional<u64> seed) {
                 const auto phases = to_phases(schedule);
                 return self.schedule_update(phases, seed);
             },
             "schedule"_a, "seed"_a = nb::none(),
             "Run (T, num_updates) phases in order; returns accepted flips.")
        .def("reset", &Sim::reset)
        .def("get_past_states", &Sim::get_past_states, "num_states"_a = nb::none())
        .def("energy", &Sim::energy)
        .def("flip_delta", &Sim::flip_delta, "label"_a,
             "Energy change if label were flipped from the current state.")
        .def("trajectory_energies",
             [](const Sim& self, std::optional<size_t> n) {
                 return from_double_vector(self.trajectory_energies(n));
             },
             "num_states"_a = nb::none())
        .def("__str__", &Sim::describe)
        .def("__repr__", &Sim::describe);
}

// Module definition
NB_MODULE(_spinsim, m) {
    m.doc() = "SpinSim C++ core bridge";

    nb::register_exception_translator(
        [](const std::exception_ptr& p, void*) {
            try {
                std::rethrow_exception(p);
            } catch (const spinsim::InvalidTerm& e) {
                PyErr_SetString(PyExc_KeyError, e.what());
            }
        });

    bind_simulation<SpinSim>(m, "SpinSimulation",
                             "Metropolis simulation of a spin model (values in {-1, 1}).");
    bind_simulation<BooleanSim>(m, "BooleanSimulation",
                                "Metropolis simulation of a boolean model (values in {0, 1}).");

    m.def("pubo_to_puso",
          [](const nb::dict& pubo) { return from_model(spinsim::pubo_to_puso(to_model(pubo))); },
          "pubo"_a,
          "Convert a boolean model to the equivalent spin model.");

    m.def("puso_to_pubo",
          [](const nb::dict& puso) { return from_model(spinsim::puso_to_pubo(to_model(puso))); },
          "puso"_a,
          "Convert a spin model to the equivalent boolean model.");

    m.def("model_value",
          [](const nb::dict& model, const State& state) { return to_model(model).value(state); },
          "model"_a, "state"_a,
          "Evaluate a model on an assignment.");
}
