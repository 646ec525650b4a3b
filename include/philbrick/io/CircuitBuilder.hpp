#pragma once

/**
 * @file CircuitBuilder.hpp
 * @brief Resolves a CircuitConfig into a runnable machine and patch bay
 *
 * Circuit-level references ("component.port") split on the LAST dot so
 * that flattened names such as "SM1.EXP0.out" resolve to component
 * "SM1.EXP0". Subcircuit instances are looked up before machine
 * components.
 */

#include <philbrick/core/ComponentRegistry.hpp>
#include <philbrick/io/CircuitConfig.hpp>
#include <philbrick/signal/PatchBay.hpp>
#include <philbrick/sim/Machine.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace philbrick {

/**
 * @brief A built circuit: machine, patch bay and subcircuit instances
 *
 * Owns everything the patch bay points into. Move-only.
 */
class Circuit {
  public:
    Circuit() = default;
    Circuit(Circuit &&) noexcept = default;
    Circuit &operator=(Circuit &&) noexcept = default;
    Circuit(const Circuit &) = delete;
    Circuit &operator=(const Circuit &) = delete;

    std::string name;
    std::string description;
    Machine machine;
    PatchBay patchbay;
    ScopeConfig scope;
    SimulationConfig simulation;

    /// Registry the circuit was built with (base types plus its own subcircuits)
    ComponentRegistry registry;

    /// Subcircuit wrappers by instance name, nested ones included ("outer.inner")
    std::map<std::string, std::unique_ptr<Component>> subcircuits;

    // =========================================================================
    // Running
    // =========================================================================

    /// One canonical tick: Propagate, then Step
    void Tick() {
        patchbay.Propagate();
        machine.Step();
    }

    void Run(int64_t ticks) {
        for (int64_t i = 0; i < ticks; ++i) {
            Tick();
        }
    }

    void Reset() { machine.Reset(); }

    // =========================================================================
    // Resolution
    // =========================================================================

    /**
     * @brief Subcircuit instance or machine component by name
     * @return nullptr if neither exists
     */
    [[nodiscard]] Component *FindComponent(const std::string &component_name) const;

    /**
     * @brief Resolve "component.port" (split on the last dot)
     *
     * @throws CircuitError MalformedReference, UnknownComponent or UnknownPort
     */
    [[nodiscard]] Port &ResolvePort(const std::string &ref, PortDirection direction) const;

    /**
     * @brief Resolve a scope channel source: outputs first, then inputs
     */
    [[nodiscard]] Port &ResolveAny(const std::string &ref) const;

    /// Read a port value by reference (output first, then input)
    [[nodiscard]] double Read(const std::string &ref) const { return ResolveAny(ref).Read(); }

    /// Write to an input port by reference
    void Write(const std::string &ref, double value) const {
        ResolvePort(ref, PortDirection::Input).Write(value);
    }
};

/**
 * @brief Builds circuits from declarations against a base registry
 *
 * Example usage:
 * @code
 * CircuitBuilder builder;                           // primitives + built-ins
 * Circuit circuit = builder.Build(CircuitLoader::Load("osc.yaml"));
 * circuit.Run(circuit.simulation.steps);
 * @endcode
 */
class CircuitBuilder {
  public:
    explicit CircuitBuilder(ComponentRegistry registry = ComponentRegistry::WithBuiltins())
        : registry_(std::move(registry)) {}

    /**
     * @brief Build a circuit into a fresh machine and patch bay
     *
     * The circuit's subcircuits are registered into a copy of the base
     * registry; the base registry is never modified. On failure the error
     * is logged and rethrown and nothing outside the attempt is touched.
     *
     * @throws CircuitError, ConfigError or WiringError
     */
    [[nodiscard]] Circuit Build(const CircuitConfig &config) const;

    [[nodiscard]] const ComponentRegistry &Registry() const { return registry_; }

  private:
    void BuildInto(const CircuitConfig &config, Circuit &circuit) const;

    ComponentRegistry registry_;
};

} // namespace philbrick
