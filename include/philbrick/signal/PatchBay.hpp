#pragma once

/**
 * @file PatchBay.hpp
 * @brief Connection graph of patch cables between ports
 *
 * Edges run from an output port to an input port and are kept in insertion
 * order. Propagate() copies each source value into its destination.
 *
 * Fan-in: several edges may share a destination. Within one Propagate()
 * the edge inserted last wins. This is the defined behavior, not an error.
 */

#include <philbrick/signal/Port.hpp>

#include <cstddef>
#include <vector>

namespace philbrick {

/**
 * @brief A single patch cable
 */
struct Connection {
    Port *source = nullptr; ///< Output port
    Port *dest = nullptr;   ///< Input port

    [[nodiscard]] bool SameEndpoints(const Port &src, const Port &dst) const {
        return source->Id() == src.Id() && dest->Id() == dst.Id();
    }
};

/**
 * @brief Ordered, de-duplicated set of patch cables
 *
 * Holds non-owning Port pointers. A PatchBay must not outlive the machine
 * (and subcircuit wrappers) owning the ports it connects.
 */
class PatchBay {
  public:
    /**
     * @brief Connect an output port to an input port
     *
     * Idempotent: a second connect of the same endpoints is a no-op.
     *
     * @throws WiringError if src is not an output or dst is not an input
     */
    void Connect(Port &src, Port &dst);

    /**
     * @brief Remove the exact (src, dst) edge if present
     */
    void Disconnect(const Port &src, const Port &dst);

    /**
     * @brief Remove all edges
     */
    void Clear() { connections_.clear(); }

    /**
     * @brief Copy every source value into its destination, in insertion order
     */
    void Propagate();

    [[nodiscard]] bool IsConnected(const Port &src, const Port &dst) const;

    [[nodiscard]] const std::vector<Connection> &GetConnections() const { return connections_; }

    [[nodiscard]] std::size_t Size() const { return connections_.size(); }

    [[nodiscard]] bool Empty() const { return connections_.empty(); }

  private:
    std::vector<Connection> connections_;
};

} // namespace philbrick
