#pragma once

/**
 * @file VoltageSource.hpp
 * @brief Sine wave voltage source
 */

#include <philbrick/core/Component.hpp>

#include <cmath>
#include <numbers>
#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Sine wave source: out = amplitude * sin(2*pi*frequency*t)
 *
 * The elapsed time t is private to the component and advances before
 * the output is computed, so the first Step writes sin(2*pi*f*dt).
 *
 * Outputs: out
 */
class VoltageSource : public Component {
  public:
    VoltageSource(std::string name, double frequency, double amplitude = 1.0)
        : Component(std::move(name)), frequency_(frequency), amplitude_(amplitude),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "VoltageSource"; }

    void Step(double dt) override {
        time_ += dt;
        out_.Write(amplitude_ * std::sin(2.0 * std::numbers::pi * frequency_ * time_));
    }

    void Reset() override {
        time_ = 0.0;
        out_.Write(0.0);
    }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("frequency", frequency_);
        cfg.SetScalar("amplitude", amplitude_);
    }

    [[nodiscard]] double Frequency() const { return frequency_; }
    [[nodiscard]] double Amplitude() const { return amplitude_; }

  private:
    double frequency_;
    double amplitude_;
    double time_ = 0.0;
    Port &out_;
};

} // namespace components
} // namespace philbrick
