#pragma once

/**
 * @file PiecewiseLinear.hpp
 * @brief Breakpoint-table function generator
 */

#include <philbrick/core/Component.hpp>
#include <philbrick/core/ComponentConfig.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace philbrick {
namespace components {

/**
 * @brief Maps its input through a piecewise linear curve
 *
 * Breakpoints are sorted by x on construction. Inputs outside the table
 * clamp to the first/last y; inside, the output is interpolated between
 * the bracketing pair. The default table is the identity on [-1, 1].
 *
 * Inputs: in
 * Outputs: out
 */
class PiecewiseLinear : public Component {
  public:
    static Table DefaultBreakpoints() { return {{-1.0, -1.0}, {1.0, 1.0}}; }

    explicit PiecewiseLinear(std::string name, Table breakpoints = DefaultBreakpoints())
        : Component(std::move(name)), breakpoints_(std::move(breakpoints)), in_(AddInput("in")),
          out_(AddOutput("out")) {
        std::stable_sort(breakpoints_.begin(), breakpoints_.end(),
                         [](const auto &a, const auto &b) { return a.first < b.first; });
    }

    [[nodiscard]] std::string TypeName() const override { return "PiecewiseLinear"; }

    void Step(double /*dt*/) override { out_.Write(Evaluate(in_.Read())); }

    void Reset() override { out_.Write(0.0); }

    void ExportParams(ComponentConfig &cfg) const override {
        cfg.SetTable("breakpoints", breakpoints_);
    }

    [[nodiscard]] const Table &Breakpoints() const { return breakpoints_; }

    /// Curve value at x
    [[nodiscard]] double Evaluate(double x) const {
        if (breakpoints_.empty()) {
            return 0.0;
        }
        if (x <= breakpoints_.front().first) {
            return breakpoints_.front().second;
        }
        if (x >= breakpoints_.back().first) {
            return breakpoints_.back().second;
        }
        for (std::size_t i = 0; i + 1 < breakpoints_.size(); ++i) {
            const auto &[x1, y1] = breakpoints_[i];
            const auto &[x2, y2] = breakpoints_[i + 1];
            if (x1 <= x && x <= x2) {
                if (x2 == x1) {
                    return y2;
                }
                double t = (x - x1) / (x2 - x1);
                return y1 + t * (y2 - y1);
            }
        }
        return breakpoints_.back().second;
    }

  private:
    Table breakpoints_;
    Port &in_;
    Port &out_;
};

} // namespace components
} // namespace philbrick
