#pragma once

/**
 * @file Component.hpp
 * @brief Base class for all circuit components
 *
 * Components expose named input/output ports and implement Step(dt) and
 * Reset(). Primitives create fresh ports in their constructor; subcircuit
 * wrappers alias ports owned by their flattened internals.
 */

#include <philbrick/core/ComponentConfig.hpp>
#include <philbrick/signal/Port.hpp>

#include <string>
#include <utility>

namespace philbrick {

/**
 * @brief Base class for all circuit components
 *
 * **Evaluation contract:**
 * - Step(dt) reads the current input port values and writes outputs.
 *   It never sees values produced by other components in the same tick;
 *   those arrive through the next PatchBay::Propagate().
 * - Step(dt) never throws. Numeric degeneracy is clamped by the component.
 *
 * Name uniqueness is upheld by the builder and composer through prefixing,
 * not by the component itself.
 */
class Component {
  public:
    explicit Component(std::string name)
        : name_(std::move(name)), inputs_(PortDirection::Input),
          outputs_(PortDirection::Output) {}

    virtual ~Component() = default;

    Component(const Component &) = delete;
    Component &operator=(const Component &) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /**
     * @brief Advance one tick
     * @param dt Time step size (seconds)
     */
    virtual void Step(double dt) = 0;

    /**
     * @brief Return internal state and outputs to their initial values
     */
    virtual void Reset() = 0;

    // =========================================================================
    // Identity & Introspection
    // =========================================================================

    /**
     * @brief Component instance name (e.g., "INT1" or "SM1.EXP0")
     */
    [[nodiscard]] const std::string &Name() const { return name_; }

    /**
     * @brief Registry type name (e.g., "Integrator", "Softmax")
     */
    [[nodiscard]] virtual std::string TypeName() const = 0;

    /**
     * @brief True for subcircuit wrappers whose ports alias flattened internals
     */
    [[nodiscard]] virtual bool IsComposite() const { return false; }

    [[nodiscard]] const PortMap &Inputs() const { return inputs_; }
    [[nodiscard]] const PortMap &Outputs() const { return outputs_; }

    /// Lookup by name; throws CircuitError(UnknownPort)
    [[nodiscard]] Port &Input(const std::string &port) const { return inputs_.At(port, name_); }
    [[nodiscard]] Port &Output(const std::string &port) const {
        return outputs_.At(port, name_);
    }

    // =========================================================================
    // Configuration Export
    // =========================================================================

    /**
     * @brief Write constructor parameters into cfg
     *
     * Used by CircuitSaver. The default exports nothing.
     */
    virtual void ExportParams(ComponentConfig & /*cfg*/) const {}

    /**
     * @brief Declaration that recreates this component through the registry
     */
    [[nodiscard]] ComponentConfig ToConfig() const {
        ComponentConfig cfg;
        cfg.name = name_;
        cfg.type = TypeName();
        ExportParams(cfg);
        return cfg;
    }

  protected:
    Port &AddInput(const std::string &port) { return inputs_.Create(port, name_); }
    Port &AddOutput(const std::string &port) { return outputs_.Create(port, name_); }

    PortMap &MutableInputs() { return inputs_; }
    PortMap &MutableOutputs() { return outputs_; }

  private:
    std::string name_;
    PortMap inputs_;
    PortMap outputs_;
};

} // namespace philbrick
