#pragma once

/**
 * @file Divider.hpp
 * @brief Guarded divider
 */

#include <philbrick/core/Component.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief out = num / max(|den|, epsilon), signed like den
 *
 * A zero denominator counts as positive. The epsilon floor keeps the
 * output finite.
 *
 * Inputs: num, den
 * Outputs: out
 */
class Divider : public Component {
  public:
    explicit Divider(std::string name, double epsilon = 1e-6)
        : Component(std::move(name)), epsilon_(epsilon), num_(AddInput("num")),
          den_(AddInput("den")), out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Divider"; }

    void Step(double /*dt*/) override {
        double den = den_.Read();
        double safe = std::max(std::abs(den), epsilon_);
        double sign = den >= 0.0 ? 1.0 : -1.0;
        out_.Write(num_.Read() / safe * sign);
    }

    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetScalar("epsilon", epsilon_); }

  private:
    double epsilon_;
    Port &num_;
    Port &den_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
