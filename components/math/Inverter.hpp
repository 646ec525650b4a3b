#pragma once

/**
 * @file Inverter.hpp
 * @brief Sign inverter
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

class Inverter : public Component {
  public:
    explicit Inverter(std::string name)
        : Component(std::move(name)), in_(AddInput("in")), out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Inverter"; }

    void Step(double /*dt*/) override { out_.Write(-in_.Read()); }
    void Reset() override { out_.Write(0.0); }

  private:
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
