/**
 * @file registration.cpp
 * @brief The primitive catalog and built-in template library
 *
 * The catalog is closed: every primitive type the registry can construct is
 * listed here with its accepted and required parameter keys. Creators read
 * already-validated configs.
 */

#include <philbrick/core/ComponentRegistry.hpp>

#include <dynamics/Integrator.hpp>
#include <generators/PiecewiseLinear.hpp>
#include <generators/SawtoothWave.hpp>
#include <generators/SquareWave.hpp>
#include <generators/TriangleWave.hpp>
#include <math/Coefficient.hpp>
#include <math/Comparator.hpp>
#include <math/Divider.hpp>
#include <math/DotProduct.hpp>
#include <math/Exp.hpp>
#include <math/Inverter.hpp>
#include <math/Limiter.hpp>
#include <math/Max.hpp>
#include <math/Multiplier.hpp>
#include <math/Summer.hpp>
#include <sources/Constant.hpp>
#include <sources/VoltageSource.hpp>
#include <subcircuits/Library.hpp>

#include <cmath>
#include <string>

namespace philbrick {

namespace {

constexpr int64_t kMaxCount = 4096;

/// Port-count parameter; accepts a whole-number scalar too
std::size_t CountParam(const ComponentConfig &cfg, const std::string &key, int64_t def) {
    int64_t n = def;
    if (cfg.Has<int64_t>(key)) {
        n = cfg.Get<int64_t>(key, def);
    } else if (cfg.Has<double>(key)) {
        const double v = cfg.Get<double>(key, static_cast<double>(def));
        if (!(v >= 0.0 && v <= static_cast<double>(kMaxCount)) || std::floor(v) != v) {
            throw CircuitError::ParameterMismatch(
                cfg.name, "'" + key + "' must be a whole number in [0, " +
                              std::to_string(kMaxCount) + "], got " + std::to_string(v));
        }
        n = static_cast<int64_t>(v);
    }
    if (n < 0 || n > kMaxCount) {
        throw CircuitError::ParameterMismatch(cfg.name, "'" + key + "' must be in [0, " +
                                                            std::to_string(kMaxCount) +
                                                            "], got " + std::to_string(n));
    }
    return static_cast<std::size_t>(n);
}

/// Breakpoint table; an empty list arrives as an empty array
Table TableParam(const ComponentConfig &cfg, const std::string &key, const Table &def) {
    if (cfg.Has<Table>(key)) {
        return cfg.Get<Table>(key, def);
    }
    return cfg.Has<std::vector<double>>(key) ? Table{} : def;
}

std::vector<PrimitiveSpec> BuildCatalog() {
    using namespace components;
    std::vector<PrimitiveSpec> catalog;

    // Sources and generators
    catalog.push_back({"VoltageSource",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<VoltageSource>(
                               cfg.name, cfg.Require<double>("frequency"),
                               cfg.Get<double>("amplitude", 1.0));
                       },
                       {"frequency", "amplitude"},
                       {"frequency"},
                       "Sine wave source"});

    catalog.push_back({"TriangleWave",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<TriangleWave>(
                               cfg.name, cfg.Require<double>("frequency"),
                               cfg.Get<double>("amplitude", 1.0));
                       },
                       {"frequency", "amplitude"},
                       {"frequency"},
                       "Triangle wave oscillator"});

    catalog.push_back({"SawtoothWave",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<SawtoothWave>(
                               cfg.name, cfg.Require<double>("frequency"),
                               cfg.Get<double>("amplitude", 1.0));
                       },
                       {"frequency", "amplitude"},
                       {"frequency"},
                       "Sawtooth oscillator"});

    catalog.push_back({"SquareWave",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<SquareWave>(
                               cfg.name, cfg.Require<double>("frequency"),
                               cfg.Get<double>("amplitude", 1.0),
                               cfg.Get<double>("duty_cycle", 0.5));
                       },
                       {"frequency", "amplitude", "duty_cycle"},
                       {"frequency"},
                       "Square wave oscillator"});

    catalog.push_back({"Constant",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Constant>(cfg.name,
                                                             cfg.Get<double>("value", 1.0));
                       },
                       {"value"},
                       {},
                       "Constant value source"});

    catalog.push_back({"PiecewiseLinear",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<PiecewiseLinear>(
                               cfg.name, TableParam(cfg, "breakpoints",
                                                    PiecewiseLinear::DefaultBreakpoints()));
                       },
                       {{"breakpoints", ParamKind::Table}},
                       {},
                       "Breakpoint-table function generator"});

    // Dynamics
    catalog.push_back({"Integrator",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Integrator>(cfg.name,
                                                               cfg.Get<double>("initial", 0.0),
                                                               cfg.Get<double>("gain", 1.0));
                       },
                       {"initial", "gain"},
                       {},
                       "Forward-Euler integrator"});

    // Arithmetic
    catalog.push_back({"Summer",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Summer>(
                               cfg.name, cfg.Get<std::vector<double>>("weights", {1.0, 1.0}));
                       },
                       {{"weights", ParamKind::Array}},
                       {},
                       "Weighted sum"});

    catalog.push_back({"Coefficient",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Coefficient>(cfg.name,
                                                                cfg.Get<double>("k", 1.0));
                       },
                       {"k"},
                       {},
                       "Constant gain"});

    catalog.push_back({"Inverter",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Inverter>(cfg.name);
                       },
                       {},
                       {},
                       "Sign inverter"});

    catalog.push_back({"Multiplier",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Multiplier>(cfg.name,
                                                               cfg.Get<double>("scale", 1.0));
                       },
                       {"scale"},
                       {},
                       "Product of two inputs"});

    catalog.push_back({"Comparator",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Comparator>(
                               cfg.name, cfg.Get<double>("threshold", 0.0),
                               cfg.Get<double>("high", 1.0), cfg.Get<double>("low", -1.0));
                       },
                       {"threshold", "high", "low"},
                       {},
                       "Threshold comparator"});

    catalog.push_back({"Limiter",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Limiter>(cfg.name,
                                                            cfg.Get<double>("min_val", -1.0),
                                                            cfg.Get<double>("max_val", 1.0));
                       },
                       {"min_val", "max_val"},
                       {},
                       "Clamp to a range"});

    catalog.push_back({"Exp",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Exp>(cfg.name, cfg.Get<double>("scale", 1.0));
                       },
                       {"scale"},
                       {},
                       "Clamped exponential"});

    catalog.push_back({"Divider",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Divider>(cfg.name,
                                                            cfg.Get<double>("epsilon", 1e-6));
                       },
                       {"epsilon"},
                       {},
                       "Guarded divider"});

    catalog.push_back({"DotProduct",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<DotProduct>(cfg.name,
                                                               CountParam(cfg, "size", 4));
                       },
                       {{"size", ParamKind::Count}},
                       {},
                       "N-element dot product"});

    catalog.push_back({"Max",
                       [](const ComponentConfig &cfg) {
                           return std::make_unique<Max>(cfg.name, CountParam(cfg, "size", 2));
                       },
                       {{"size", ParamKind::Count}},
                       {},
                       "Maximum of N inputs"});

    return catalog;
}

} // anonymous namespace

const std::vector<PrimitiveSpec> &PrimitiveCatalog() {
    static const std::vector<PrimitiveSpec> catalog = BuildCatalog();
    return catalog;
}

ComponentRegistry ComponentRegistry::WithBuiltins() {
    ComponentRegistry registry;
    registry.Register(components::SoftmaxTemplate());
    registry.Register(components::AttentionHeadTemplate());
    return registry;
}

} // namespace philbrick
