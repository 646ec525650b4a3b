#pragma once

/**
 * @file DotProduct.hpp
 * @brief N-element dot product
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>
#include <vector>

namespace philbrick {
namespace components {

/**
 * @brief out = sum(a_i * b_i)
 *
 * Inputs: a0..aN-1, then b0..bN-1
 * Outputs: out
 */
class DotProduct : public Component {
  public:
    explicit DotProduct(std::string name, std::size_t size = 4)
        : Component(std::move(name)), out_(AddOutput("out")) {
        a_.reserve(size);
        b_.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            a_.push_back(&AddInput("a" + std::to_string(i)));
        }
        for (std::size_t i = 0; i < size; ++i) {
            b_.push_back(&AddInput("b" + std::to_string(i)));
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "DotProduct"; }

    void Step(double /*dt*/) override {
        double sum = 0.0;
        for (std::size_t i = 0; i < a_.size(); ++i) {
            sum += a_[i]->Read() * b_[i]->Read();
        }
        out_.Write(sum);
    }

    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetInteger("size", static_cast<int64_t>(a_.size()));
    }

    [[nodiscard]] std::size_t Size() const { return a_.size(); }

  private:
    std::vector<Port *> a_;
    std::vector<Port *> b_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
