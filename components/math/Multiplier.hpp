#pragma once

/**
 * @file Multiplier.hpp
 * @brief Four-quadrant multiplier
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief out = x * y * scale
 *
 * Inputs: x, y
 * Outputs: out
 */
class Multiplier : public Component {
  public:
    explicit Multiplier(std::string name, double scale = 1.0)
        : Component(std::move(name)), scale_(scale), x_(AddInput("x")), y_(AddInput("y")),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Multiplier"; }

    void Step(double /*dt*/) override { out_.Write(x_.Read() * y_.Read() * scale_); }
    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetScalar("scale", scale_); }

  private:
    double scale_;
    Port &x_;
    Port &y_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
