#pragma once

/**
 * @file Constant.hpp
 * @brief Constant value source
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Writes a fixed value on construction, every step and on reset
 *
 * Outputs: out
 */
class Constant : public Component {
  public:
    explicit Constant(std::string name, double value = 1.0)
        : Component(std::move(name)), value_(value), out_(AddOutput("out")) {
        out_.Write(value_);
    }

    [[nodiscard]] std::string TypeName() const override { return "Constant"; }

    void Step(double /*dt*/) override { out_.Write(value_); }
    void Reset() override { out_.Write(value_); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetScalar("value", value_); }

    [[nodiscard]] double Value() const { return value_; }

  private:
    double value_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
