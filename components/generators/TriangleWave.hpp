#pragma once

/**
 * @file TriangleWave.hpp
 * @brief Triangle wave oscillator
 */

#include <philbrick/core/Component.hpp>

#include <generators/Phase.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Triangle wave rising from -amplitude to +amplitude over the first
 * half period and falling back over the second
 *
 * Outputs: out
 */
class TriangleWave : public Component {
  public:
    TriangleWave(std::string name, double frequency, double amplitude = 1.0)
        : Component(std::move(name)), frequency_(frequency), amplitude_(amplitude),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "TriangleWave"; }

    void Step(double dt) override {
        time_ += dt;
        double phase = NormalizedPhase(frequency_, time_);
        double value = phase < 0.5 ? -1.0 + 4.0 * phase : 3.0 - 4.0 * phase;
        out_.Write(amplitude_ * value);
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
