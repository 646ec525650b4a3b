#pragma once

/**
 * @file Signal.hpp
 * @brief Scalar signal cell carried by ports
 *
 * A Signal holds one double. It has no history and no units; the patch bay
 * moves values between signals, components read and write them.
 */

namespace philbrick {

/**
 * @brief A single mutable scalar value cell
 */
class Signal {
  public:
    Signal() = default;
    explicit Signal(double initial) : value_(initial) {}

    [[nodiscard]] double Read() const { return value_; }
    void Write(double value) { value_ = value; }

  private:
    double value_ = 0.0;
};

} // namespace philbrick
