#pragma once

/**
 * @file Exp.hpp
 * @brief Exponential function generator
 */

#include <philbrick/core/Component.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief out = exp(clamp(in * scale, -10, 10))
 *
 * The exponent is clamped so the output stays finite.
 *
 * Inputs: in
 * Outputs: out
 */
class Exp : public Component {
  public:
    static constexpr double kExponentLimit = 10.0;

    explicit Exp(std::string name, double scale = 1.0)
        : Component(std::move(name)), scale_(scale), in_(AddInput("in")),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Exp"; }

    void Step(double /*dt*/) override {
        double x = std::clamp(in_.Read() * scale_, -kExponentLimit, kExponentLimit);
        out_.Write(std::exp(x));
    }

    void Reset() override { out_.Write(1.0); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetScalar("scale", scale_); }

  private:
    double scale_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
