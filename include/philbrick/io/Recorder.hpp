#pragma once

#include <string>

namespace philbrick {

/**
 * @brief Scope channel recorder interface.
 *
 * Records watched port values to persistent storage.
 */
class Recorder {
  public:
    virtual ~Recorder() = default;

    /**
     * @brief Open recording file.
     */
    virtual void Open(const std::string &path) = 0;

    /**
     * @brief Close recording file.
     */
    virtual void Close() = 0;

    /**
     * @brief Record current channel values.
     */
    virtual void Record(double time) = 0;
};

} // namespace philbrick
