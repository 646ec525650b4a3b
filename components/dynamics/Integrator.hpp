#pragma once

/**
 * @file Integrator.hpp
 * @brief Forward-Euler integrator
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Accumulates its input over time
 *
 * state += in * gain * dt; out = state.
 * The output holds the initial value from construction onwards, so a
 * downstream component sees it on the first Propagate.
 *
 * Inputs: in
 * Outputs: out
 */
class Integrator : public Component {
  public:
    explicit Integrator(std::string name, double initial = 0.0, double gain = 1.0)
        : Component(std::move(name)), initial_(initial), gain_(gain), state_(initial),
          in_(AddInput("in")), out_(AddOutput("out")) {
        out_.Write(state_);
    }

    [[nodiscard]] std::string TypeName() const override { return "Integrator"; }

    void Step(double dt) override {
        state_ += in_.Read() * gain_ * dt;
        out_.Write(state_);
    }

    void Reset() override {
        state_ = initial_;
        out_.Write(state_);
    }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("initial", initial_);
        cfg.SetScalar("gain", gain_);
    }

    [[nodiscard]] double State() const { return state_; }
    [[nodiscard]] double Initial() const { return initial_; }
    [[nodiscard]] double Gain() const { return gain_; }

  private:
    double initial_;
    double gain_;
    double state_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
