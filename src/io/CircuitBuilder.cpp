/**
 * @file CircuitBuilder.cpp
 * @brief Circuit resolver implementation
 */

#include <philbrick/core/ErrorLogging.hpp>
#include <philbrick/core/PortRef.hpp>
#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/io/LogService.hpp>
#include <philbrick/sim/Subcircuit.hpp>

#include <utility>

namespace philbrick {

namespace {

/// Index a wrapper and, recursively, the wrappers nested inside it
void IndexSubcircuit(std::map<std::string, Component *> &index, Component &wrapper) {
    index[wrapper.Name()] = &wrapper;
    if (auto *sub = dynamic_cast<SubcircuitComponent *>(&wrapper)) {
        for (const auto &nested : sub->Nested()) {
            IndexSubcircuit(index, *nested);
        }
    }
}

} // namespace

// =============================================================================
// Circuit
// =============================================================================

Component *Circuit::FindComponent(const std::string &component_name) const {
    auto it = subcircuits.find(component_name);
    if (it != subcircuits.end()) {
        return it->second.get();
    }
    // Nested instances live inside their outer wrapper
    for (const auto &[instance, wrapper] : subcircuits) {
        if (component_name.rfind(instance + ".", 0) != 0) {
            continue;
        }
        std::map<std::string, Component *> index;
        IndexSubcircuit(index, *wrapper);
        auto nested = index.find(component_name);
        if (nested != index.end()) {
            return nested->second;
        }
    }
    return machine.FindComponent(component_name);
}

Port &Circuit::ResolvePort(const std::string &ref, PortDirection direction) const {
    PortRef parsed = ParsePortRef(ref, SplitRule::LastDot);
    Component *comp = FindComponent(parsed.component);
    if (comp == nullptr) {
        throw CircuitError::UnknownComponent(parsed.component, "referenced by '" + ref + "'");
    }
    return direction == PortDirection::Output ? comp->Output(parsed.port)
                                              : comp->Input(parsed.port);
}

Port &Circuit::ResolveAny(const std::string &ref) const {
    PortRef parsed = ParsePortRef(ref, SplitRule::LastDot);
    Component *comp = FindComponent(parsed.component);
    if (comp == nullptr) {
        throw CircuitError::UnknownComponent(parsed.component, "referenced by '" + ref + "'");
    }
    if (Port *p = comp->Outputs().Find(parsed.port)) {
        return *p;
    }
    if (Port *p = comp->Inputs().Find(parsed.port)) {
        return *p;
    }
    throw CircuitError::UnknownPort(parsed.component, parsed.port, true);
}

// =============================================================================
// CircuitBuilder
// =============================================================================

Circuit CircuitBuilder::Build(const CircuitConfig &config) const {
    ScopedLogContext ctx(config.name, "");
    Circuit circuit;
    try {
        BuildInto(config, circuit);
    } catch (const Error &e) {
        LogError(e);
        throw;
    }

    PHILBRICK_LOG_INFO(0.0, "Built circuit '" + config.name + "': " +
                                std::to_string(circuit.machine.Size()) + " components, " +
                                std::to_string(circuit.patchbay.Size()) + " patches, " +
                                std::to_string(circuit.subcircuits.size()) +
                                " subcircuit instances");
    return circuit;
}

void CircuitBuilder::BuildInto(const CircuitConfig &config, Circuit &circuit) const {
    circuit.name = config.name;
    circuit.description = config.description;
    circuit.scope = config.scope;
    circuit.simulation = config.simulation;
    circuit.machine.SetDt(config.simulation.dt);

    // 1. Scoped registry with this circuit's subcircuits
    circuit.registry = registry_;
    for (const auto &tmpl : config.subcircuits) {
        circuit.registry.Register(tmpl);
    }

    // 2. Components
    for (const auto &decl : config.components) {
        if (circuit.FindComponent(decl.name) != nullptr) {
            throw ConfigError("Duplicate component name '" + decl.name + "'",
                              config.source_file);
        }
        auto comp = circuit.registry.Create(decl, circuit.machine, circuit.patchbay);
        if (comp->IsComposite()) {
            std::map<std::string, Component *> nested;
            IndexSubcircuit(nested, *comp);
            for (const auto &[nested_name, wrapper] : nested) {
                if (nested_name != decl.name && circuit.FindComponent(nested_name) != nullptr) {
                    throw ConfigError("Subcircuit '" + decl.name + "' nests '" + nested_name +
                                          "', which is already a component",
                                      config.source_file);
                }
            }
            circuit.subcircuits.emplace(decl.name, std::move(comp));
        } else {
            circuit.machine.Add(std::move(comp));
        }
    }

    // 3-4. Patches
    for (const auto &[src_ref, dst_ref] : config.patches) {
        Port &src = circuit.ResolvePort(src_ref, PortDirection::Output);
        Port &dst = circuit.ResolvePort(dst_ref, PortDirection::Input);
        circuit.patchbay.Connect(src, dst);
    }

    // Scope channels must resolve too
    for (const auto &channel : config.scope.channels) {
        (void)circuit.ResolveAny(channel.source);
    }
}

} // namespace philbrick
