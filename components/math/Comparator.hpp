#pragma once

/**
 * @file Comparator.hpp
 * @brief Threshold comparator
 */

#include <philbrick/core/Component.hpp>

#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief out = high if in >= threshold, else low
 */
class Comparator : public Component {
  public:
    explicit Comparator(std::string name, double threshold = 0.0, double high = 1.0,
                        double low = -1.0)
        : Component(std::move(name)), threshold_(threshold), high_(high), low_(low),
          in_(AddInput("in")), out_(AddOutput("out")) {}

    [[nodiscard]] std::string TypeName() const override { return "Comparator"; }

    void Step(double /*dt*/) override { out_.Write(in_.Read() >= threshold_ ? high_ : low_); }
    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetScalar("threshold", threshold_);
        cfg.SetScalar("high", high_);
        cfg.SetScalar("low", low_);
    }

  private:
    double threshold_;
    double high_;
    double low_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
