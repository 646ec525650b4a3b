#pragma once

/**
 * @file Coefficient.hpp
 * @brief Coefficient potentiometer (constant gain)
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief out = in * k
 */
class Coefficient : public Component {
  public:
    explicit Coefficient(std::string name, double k = 1.0)
        : Component(std::move(name)), k_(k), in_(AddInput("in")), out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Coefficient"; }

    void Step(double /*dt*/) override { out_.Write(in_.Read() * k_); }
    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetScalar("k", k_); }

    [[nodiscard]] double K() const { return k_; }

  private:
    double k_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
