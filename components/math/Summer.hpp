#pragma once

/**
 * @file Summer.hpp
 * @brief Weighted summing amplifier
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>
#include <vector>

namespace philbrick {
namespace components {

/**
 * @brief out = sum(in_i * weight_i)
 *
 * One input per weight, named in0..inN-1.
 *
 * Inputs: in0..inN-1
 * Outputs: out
 */
class Summer : public Component {
  public:
    explicit Summer(std::string name, std::vector<double> weights = {1.0, 1.0})
        : Component(std::move(name)), weights_(std::move(weights)), out_(AddOutput("out")) {
        inputs_.reserve(weights_.size());
        for (std::size_t i = 0; i < weights_.size(); ++i) {
            inputs_.push_back(&AddInput("in" + std::to_string(i)));
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "Summer"; }

    void Step(double /*dt*/) override {
        double sum = 0.0;
        for (std::size_t i = 0; i < weights_.size(); ++i) {
            sum += inputs_[i]->Read() * weights_[i];
        }
        out_.Write(sum);
    }

    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override { cfg.SetArray("weights", weights_); }

    [[nodiscard]] const std::vector<double> &Weights() const { return weights_; }

  private:
    std::vector<double> weights_;
    std::vector<Port *> inputs_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
