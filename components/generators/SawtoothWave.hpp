#pragma once

/**
 * @file SawtoothWave.hpp
 * @brief Sawtooth (ramp) oscillator
 */

#include <philbrick/core/Component.hpp>

#include <generators/Phase.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Linear ramp from -amplitude to +amplitude across each period
 *
 * Outputs: out
 */
class SawtoothWave : public Component {
  public:
    SawtoothWave(std::string name, double frequency, double amplitude = 1.0)
        : Component(std::move(name)), frequency_(frequency), amplitude_(amplitude),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "SawtoothWave"; }

    void Step(double dt) override {
        time_ += dt;
        double phase = NormalizedPhase(frequency_, time_);
        out_.Write(amplitude_ * (-1.0 + 2.0 * phase));
    }

    void Reset() override {
        time_ = 0.0;
        out_.Write(-amplitude_);
    }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("frequency", frequency_);
        cfg.SetScalar("amplitude", amplitude_);
    }

  private:
    double frequency_;
    double amplitude_;
    double time_ = 0.0;
    Port &out_;
};

} // namespace components
} // namespace philbrick
