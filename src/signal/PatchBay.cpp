/**
 * @file PatchBay.cpp
 * @brief Connection graph implementation
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/signal/PatchBay.hpp>

#include <algorithm>

namespace philbrick {

void PatchBay::Connect(Port &src, Port &dst) {
    if (!src.IsOutput()) {
        throw WiringError(src.FullName(), dst.FullName(), "source must be an output port");
    }
    if (!dst.IsInput()) {
        throw WiringError(src.FullName(), dst.FullName(), "destination must be an input port");
    }
    if (IsConnected(src, dst)) {
        return;
    }
    connections_.push_back(Connection{&src, &dst});
}

void PatchBay::Disconnect(const Port &src, const Port &dst) {
    auto it = std::find_if(connections_.begin(), connections_.end(),
                           [&](const Connection &c) { return c.SameEndpoints(src, dst); });
    if (it != connections_.end()) {
        connections_.erase(it);
    }
}

void PatchBay::Propagate() {
    for (auto &c : connections_) {
        c.dest->Write(c.source->Read());
    }
}

bool PatchBay::IsConnected(const Port &src, const Port &dst) const {
    return std::any_of(connections_.begin(), connections_.end(),
                       [&](const Connection &c) { return c.SameEndpoints(src, dst); });
}

} // namespace philbrick
