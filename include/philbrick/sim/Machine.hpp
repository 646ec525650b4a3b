#pragma once

/**
 * @file Machine.hpp
 * @brief Simulation clock owning the ordered component list
 *
 * The canonical tick is PatchBay::Propagate() followed by Machine::Step().
 * Propagate moves the values produced by the previous Step across patch
 * cables; Step then recomputes every component from its current inputs.
 * Stepping without an intervening Propagate leaves cross-component wiring
 * stale by one tick.
 */

#include <philbrick/core/Component.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace philbrick {

/**
 * @brief Fixed-step simulation clock
 *
 * Components are stepped in registration order, not data-dependency order.
 * Single-threaded; components must not be added while a run loop is active.
 */
class Machine {
  public:
    static constexpr double kDefaultDt = 0.001;

    explicit Machine(double dt = kDefaultDt);

    Machine(const Machine &) = delete;
    Machine &operator=(const Machine &) = delete;
    Machine(Machine &&) noexcept = default;
    Machine &operator=(Machine &&) noexcept = default;

    /**
     * @brief Take ownership of a component and append it to the step order
     * @return Reference to the added component
     */
    Component &Add(std::unique_ptr<Component> component);

    /**
     * @brief Advance time by dt, then step every component in order
     */
    void Step();

    /**
     * @brief Zero the clock and reset every component
     */
    void Reset();

    [[nodiscard]] double Time() const { return time_; }
    [[nodiscard]] double Dt() const { return dt_; }

    /// @throws ConfigError if dt is not positive
    void SetDt(double dt);

    [[nodiscard]] const std::vector<std::unique_ptr<Component>> &Components() const {
        return components_;
    }

    [[nodiscard]] std::size_t Size() const { return components_.size(); }

    /// Find by name, nullptr if absent
    [[nodiscard]] Component *FindComponent(const std::string &name) const;

    /// @throws CircuitError(UnknownComponent) if absent
    [[nodiscard]] Component &GetComponent(const std::string &name) const;

  private:
    double time_ = 0.0;
    double dt_;
    std::vector<std::unique_ptr<Component>> components_;
};

} // namespace philbrick
