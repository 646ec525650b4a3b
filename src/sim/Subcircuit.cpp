/**
 * @file Subcircuit.cpp
 * @brief Subcircuit composer: flattens a template into a machine
 */

#include <philbrick/core/ComponentRegistry.hpp>
#include <philbrick/core/Config.hpp>
#include <philbrick/core/Error.hpp>
#include <philbrick/core/PortRef.hpp>
#include <philbrick/io/LogService.hpp>
#include <philbrick/sim/Machine.hpp>
#include <philbrick/sim/Subcircuit.hpp>
#include <philbrick/signal/PatchBay.hpp>

#include <utility>

namespace philbrick {

namespace {

Component &LocalComponent(const SubcircuitComponent &wrapper, const std::string &local) {
    Component *comp = wrapper.FindLocal(local);
    if (comp == nullptr) {
        throw CircuitError::UnknownComponent(local, "not declared in subcircuit '" +
                                                        wrapper.Name() + "' (" +
                                                        wrapper.TypeName() + ")");
    }
    return *comp;
}

/// Resolve a template-local "local.port" reference
Port &ResolveLocal(const SubcircuitComponent &wrapper, const std::string &ref,
                   PortDirection direction) {
    PortRef parsed = ParsePortRef(ref, SplitRule::FirstDot);
    Component &comp = LocalComponent(wrapper, parsed.component);
    return direction == PortDirection::Output ? comp.Output(parsed.port)
                                              : comp.Input(parsed.port);
}

/// Explicit map entry first, then the first local component exposing `name`
Port &ResolveExposed(const SubcircuitComponent &wrapper, const std::string &name,
                     const std::map<std::string, std::string> &port_map,
                     PortDirection direction) {
    auto mapped = port_map.find(name);
    if (mapped != port_map.end()) {
        return ResolveLocal(wrapper, mapped->second, direction);
    }
    for (const auto &[local, comp] : wrapper.Locals()) {
        const PortMap &ports =
            direction == PortDirection::Output ? comp->Outputs() : comp->Inputs();
        if (Port *p = ports.Find(name)) {
            return *p;
        }
    }
    throw CircuitError::PortMapping(wrapper.Name(), name, direction == PortDirection::Output);
}

} // namespace

std::unique_ptr<SubcircuitComponent> InstantiateSubcircuit(const SubcircuitTemplate &tmpl,
                                                           const std::string &instance_name,
                                                           const ComponentRegistry &registry,
                                                           Machine &machine, PatchBay &patchbay) {
    auto wrapper = std::make_unique<SubcircuitComponent>(instance_name, tmpl.name);

    // 1. Internal components, globally prefixed
    for (const auto &decl : tmpl.components) {
        ComponentConfig cfg = decl;
        cfg.name = instance_name + "." + decl.name;
        if (machine.FindComponent(cfg.name) != nullptr) {
            throw ConfigError("Subcircuit '" + instance_name + "' expands to '" + cfg.name +
                              "', which is already a component");
        }

        auto comp = registry.Create(cfg, machine, patchbay);
        if (comp->IsComposite()) {
            wrapper->AddLocal(decl.name, *comp);
            wrapper->AdoptNested(std::move(comp));
        } else {
            wrapper->AddLocal(decl.name, machine.Add(std::move(comp)));
        }
    }

    PHILBRICK_ASSERT(wrapper->Locals().size() == tmpl.components.size(),
                     "every template component has a local entry");

    // 2. Internal patches against the local namespace
    for (const auto &[src_ref, dst_ref] : tmpl.patches) {
        Port &src = ResolveLocal(*wrapper, src_ref, PortDirection::Output);
        Port &dst = ResolveLocal(*wrapper, dst_ref, PortDirection::Input);
        patchbay.Connect(src, dst);
    }

    // 3-4. Exposed port tables
    for (const auto &name : tmpl.inputs) {
        wrapper->ExposeInput(name,
                             ResolveExposed(*wrapper, name, tmpl.input_map, PortDirection::Input));
    }
    for (const auto &name : tmpl.outputs) {
        wrapper->ExposeOutput(
            name, ResolveExposed(*wrapper, name, tmpl.output_map, PortDirection::Output));
    }

    PHILBRICK_LOG_DEBUG(machine.Time(), "Instantiated " + tmpl.name + " as '" + instance_name +
                                            "' (" + std::to_string(tmpl.components.size()) +
                                            " components, " +
                                            std::to_string(tmpl.patches.size()) + " patches)");
    return wrapper;
}

} // namespace philbrick
