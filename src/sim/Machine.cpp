/**
 * @file Machine.cpp
 * @brief Simulation clock implementation
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/sim/Machine.hpp>

#include <utility>

namespace philbrick {

Machine::Machine(double dt) : dt_(dt) {
    if (!(dt > 0.0)) {
        throw ConfigError("Machine: dt must be positive, got " + std::to_string(dt));
    }
}

Component &Machine::Add(std::unique_ptr<Component> component) {
    if (!component) {
        throw ConfigError("Machine: cannot add a null component");
    }
    components_.push_back(std::move(component));
    return *components_.back();
}

void Machine::Step() {
    time_ += dt_;
    for (auto &c : components_) {
        c->Step(dt_);
    }
}

void Machine::Reset() {
    time_ = 0.0;
    for (auto &c : components_) {
        c->Reset();
    }
}

void Machine::SetDt(double dt) {
    if (!(dt > 0.0)) {
        throw ConfigError("Machine: dt must be positive, got " + std::to_string(dt));
    }
    dt_ = dt;
}

Component *Machine::FindComponent(const std::string &name) const {
    for (const auto &c : components_) {
        if (c->Name() == name) {
            return c.get();
        }
    }
    return nullptr;
}

Component &Machine::GetComponent(const std::string &name) const {
    Component *c = FindComponent(name);
    if (c == nullptr) {
        throw CircuitError::UnknownComponent(name, "not found in machine");
    }
    return *c;
}

} // namespace philbrick
