#pragma once

/**
 * @file Subcircuit.hpp
 * @brief Subcircuit templates and their flattening into a machine
 *
 * A template is expanded into uniquely prefixed primitive components
 * ("instance.local") that are added to the machine and wired through the
 * patch bay. The resulting SubcircuitComponent wrapper exposes the declared
 * external ports as aliases of the internal ports so outer wiring can treat
 * the instance like any other component.
 *
 * Settling: internals are stepped by the machine like every other primitive,
 * so a chain of N serial internal stages needs N (Propagate, Step) cycles
 * before a change at an exposed input reaches an exposed output.
 */

#include <philbrick/core/Component.hpp>
#include <philbrick/core/ComponentConfig.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace philbrick {

class ComponentRegistry;
class Machine;
class PatchBay;

/// (source ref, destination ref), each "component.port"
using PatchDecl = std::pair<std::string, std::string>;

// =============================================================================
// SubcircuitTemplate
// =============================================================================

/**
 * @brief Reusable circuit fragment with declared external ports
 *
 * Internal references (patches, input_map, output_map) are template-local:
 * the component part is a local name, split on the first dot.
 */
struct SubcircuitTemplate {
    std::string name; ///< Registry type name
    std::string description;
    std::vector<std::string> inputs;  ///< Declared external inputs, in order
    std::vector<std::string> outputs; ///< Declared external outputs, in order
    std::vector<ComponentConfig> components;
    std::vector<PatchDecl> patches;
    std::map<std::string, std::string> input_map;  ///< external name -> "local.port"
    std::map<std::string, std::string> output_map; ///< external name -> "local.port"
};

// =============================================================================
// SubcircuitComponent
// =============================================================================

/**
 * @brief Passive wrapper for one instantiated subcircuit
 *
 * Its input/output tables alias the flattened internal ports. Step and
 * Reset do nothing; the machine steps the internals directly. Wrappers of
 * nested subcircuits are owned here and never added to the machine.
 */
class SubcircuitComponent : public Component {
  public:
    SubcircuitComponent(std::string name, std::string template_name)
        : Component(std::move(name)), template_name_(std::move(template_name)) {}

    void Step(double /*dt*/) override {}
    void Reset() override {}

    [[nodiscard]] std::string TypeName() const override { return template_name_; }
    [[nodiscard]] bool IsComposite() const override { return true; }

    void ExposeInput(const std::string &key, Port &port) { MutableInputs().Alias(key, port); }
    void ExposeOutput(const std::string &key, Port &port) { MutableOutputs().Alias(key, port); }

    /// Record an internal component under its local name (non-owning)
    void AddLocal(const std::string &local_name, Component &component) {
        locals_.emplace_back(local_name, &component);
    }

    /// Take ownership of a nested subcircuit wrapper
    void AdoptNested(std::unique_ptr<Component> nested) { nested_.push_back(std::move(nested)); }

    /// Internal components keyed by local name, in declaration order
    [[nodiscard]] const std::vector<std::pair<std::string, Component *>> &Locals() const {
        return locals_;
    }

    /// Local component by local name, nullptr if absent
    [[nodiscard]] Component *FindLocal(const std::string &local_name) const {
        for (const auto &[local, comp] : locals_) {
            if (local == local_name)
                return comp;
        }
        return nullptr;
    }

    [[nodiscard]] const std::vector<std::unique_ptr<Component>> &Nested() const {
        return nested_;
    }

  private:
    std::string template_name_;
    std::vector<std::pair<std::string, Component *>> locals_;
    std::vector<std::unique_ptr<Component>> nested_;
};

// =============================================================================
// Composer
// =============================================================================

/**
 * @brief Expand a template into the machine and patch bay
 *
 * 1. Create every internal component as "instance.local" through the
 *    registry. Primitives go to the machine; nested templates recurse.
 * 2. Wire internal patches, resolving references against the local names.
 * 3. Map each declared input: explicit input_map entry first, otherwise the
 *    first local component (declaration order) with an input of that name.
 * 4. Same for declared outputs.
 *
 * @throws CircuitError UnknownType, UnknownComponent, UnknownPort,
 *         MalformedReference or PortMappingError
 */
std::unique_ptr<SubcircuitComponent> InstantiateSubcircuit(const SubcircuitTemplate &tmpl,
                                                           const std::string &instance_name,
                                                           const ComponentRegistry &registry,
                                                           Machine &machine, PatchBay &patchbay);

} // namespace philbrick
