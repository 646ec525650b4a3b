#pragma once

/**
 * @file CircuitConfig.hpp
 * @brief Declarative circuit schema
 *
 * Produced by CircuitLoader (YAML) or built programmatically, consumed by
 * CircuitBuilder. CircuitSaver produces the same structure from a live
 * machine and patch bay.
 */

#include <philbrick/core/ComponentConfig.hpp>
#include <philbrick/sim/Subcircuit.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace philbrick {

/**
 * @brief One scope channel: a port to watch and an optional display label
 */
struct ScopeChannel {
    std::string source; ///< "component.port" (output first, input as fallback)
    std::string label;

    [[nodiscard]] std::string DisplayLabel() const { return label.empty() ? source : label; }
};

struct ScopeConfig {
    std::vector<ScopeChannel> channels;

    [[nodiscard]] bool Empty() const { return channels.empty(); }
};

/**
 * @brief Batch run settings
 */
struct SimulationConfig {
    static constexpr double kDefaultDt = 0.001;
    static constexpr int64_t kDefaultSteps = 1000;

    double dt = kDefaultDt;
    int64_t steps = kDefaultSteps;
};

/**
 * @brief Complete circuit declaration
 *
 * YAML Format:
 * @code
 * name: harmonic_oscillator
 * description: x'' = -x
 * components:
 *   - name: INT1
 *     type: Integrator
 *     params: { initial: 1.0 }
 *   - name: INV
 *     type: Inverter
 * patches:
 *   - [INT1.out, INV.in]
 * scope:
 *   channels:
 *     - { source: INT1.out, label: x }
 * subcircuits:
 *   Doubler: { inputs: [in], outputs: [out], components: [...], patches: [] }
 * imports: [lib/softmax.yaml]
 * simulation: { dt: 0.01, steps: 500 }
 * @endcode
 */
struct CircuitConfig {
    std::string name;
    std::string description;
    std::vector<ComponentConfig> components;
    std::vector<PatchDecl> patches;
    ScopeConfig scope;

    /// Inline and imported templates, in registration order
    std::vector<SubcircuitTemplate> subcircuits;

    /// Import paths as written in the file
    std::vector<std::string> imports;

    SimulationConfig simulation;

    /// File this config was loaded from ("<string>" when parsed from text)
    std::string source_file;

    /**
     * @brief Structural checks that need no registry
     * @return List of problems (empty if valid)
     */
    [[nodiscard]] std::vector<std::string> Validate() const {
        std::vector<std::string> errors;
        std::set<std::string> names;
        for (const auto &comp : components) {
            if (comp.name.empty()) {
                errors.push_back("component with type '" + comp.type + "' has no name");
            } else if (!names.insert(comp.name).second) {
                errors.push_back("duplicate component name '" + comp.name + "'");
            }
            if (comp.type.empty()) {
                errors.push_back("component '" + comp.name + "' has no type");
            }
        }
        for (const auto &[src, dst] : patches) {
            if (src.empty() || dst.empty()) {
                errors.push_back("patch with empty endpoint: [" + src + ", " + dst + "]");
            }
        }
        if (!(simulation.dt > 0.0)) {
            errors.push_back("simulation.dt must be positive");
        }
        if (simulation.steps < 0) {
            errors.push_back("simulation.steps cannot be negative");
        }
        return errors;
    }
};

} // namespace philbrick
