#pragma once

/**
 * @file Limiter.hpp
 * @brief Hard clamp to [min_val, max_val]
 */

#include <philbrick/core/Component.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace philbrick {
namespace components {

class Limiter : public Component {
  public:
    explicit Limiter(std::string name, double min_val = -1.0, double max_val = 1.0)
        : Component(std::move(name)), min_val_(min_val), max_val_(max_val), in_(AddInput("in")),
          out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Limiter"; }

    // An inverted range yields min_val
    void Step(double /*dt*/) override {
        out_.Write(std::max(min_val_, std::min(in_.Read(), max_val_)));
    }
    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("min_val", min_val_);
        cfg.SetScalar("max_val", max_val_);
    }

  private:
    double min_val_;
    double max_val_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
