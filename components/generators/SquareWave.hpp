#pragma once

/**
 * @file SquareWave.hpp
 * @brief Square wave oscillator with duty cycle
 */

#include <philbrick/core/Component.hpp>

#include <generators/Phase.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief +amplitude for the first duty_cycle fraction of each period,
 * -amplitude for the rest
 *
 * Outputs: out
 */
class SquareWave : public Component {
  public:
    SquareWave(std::string name, double frequency, double amplitude = 1.0,
               double duty_cycle = 0.5)
        : Component(std::move(name)), frequency_(frequency), amplitude_(amplitude),
          duty_cycle_(duty_cycle), out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "SquareWave"; }

    void Step(double dt) override {
        time_ += dt;
        double phase = NormalizedPhase(frequency_, time_);
        out_.Write(phase < duty_cycle_ ? amplitude_ : -amplitude_);
    }

    void Reset() override {
        time_ = 0.0;
        out_.Write(amplitude_);
    }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("frequency", frequency_);
        cfg.SetScalar("amplitude", amplitude_);
        cfg.SetScalar("duty_cycle", duty_cycle_);
    }

  private:
    double frequency_;
    double amplitude_;
    double duty_cycle_;
    double time_ = 0.0;
    Port &out_;
};

} // namespace components
} // namespace philbrick
