#pragma once

/**
 * @file Max.hpp
 * @brief Maximum selector
 */

#include <philbrick/core/Component.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace philbrick {
namespace components {

/**
 * @brief out = max(in_i)
 *
 * With zero inputs the output stays 0.
 *
 * Inputs: in0..inN-1
 * Outputs: out
 */
class Max : public Component {
  public:
    explicit Max(std::string name, std::size_t size = 2)
        : Component(std::move(name)), out_(AddOutput("out")) {
        inputs_.reserve(size);
        for (std::size_t i = 0; i < size; ++i) {
            inputs_.push_back(&AddInput("in" + std::to_string(i)));
        }
    }

    [[nodiscard]] std::string TypeName() const override { return "Max"; }

    void Step(double /*dt*/) override {
        if (inputs_.empty()) {
            return;
        }
        double best = inputs_.front()->Read();
        for (std::size_t i = 1; i < inputs_.size(); ++i) {
            best = std::max(best, inputs_[i]->Read());
        }
        out_.Write(best);
    }

    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetInteger("size", static_cast<int64_t>(inputs_.size()));
    }

  private:
    std::vector<Port *> inputs_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
