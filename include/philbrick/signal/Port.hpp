#pragma once

/**
 * @file Port.hpp
 * @brief Input/output terminals and the ordered port table
 *
 * Every port owns a fresh Signal unless a caller deliberately binds a shared
 * one. Ports carry a process-unique PortId so that patch edges can be
 * de-duplicated by endpoint identity rather than by address or value.
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/signal/Signal.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace philbrick {

/// Process-unique port identity
using PortId = uint64_t;

/// Port direction
enum class PortDirection : uint8_t {
    Input,
    Output
};

[[nodiscard]] inline const char *ToString(PortDirection dir) {
    return dir == PortDirection::Input ? "input" : "output";
}

// =============================================================================
// Port
// =============================================================================

/**
 * @brief A named terminal on a component
 */
class Port {
  public:
    Port(std::string name, PortDirection direction, std::string owner = "")
        : name_(std::move(name)), owner_(std::move(owner)), direction_(direction),
          id_(NextId()), signal_(std::make_shared<Signal>()) {}

    // Identity is tied to the instance
    Port(const Port &) = delete;
    Port &operator=(const Port &) = delete;

    [[nodiscard]] const std::string &Name() const { return name_; }

    /// Name of the component that created this port
    [[nodiscard]] const std::string &Owner() const { return owner_; }

    [[nodiscard]] PortDirection Direction() const { return direction_; }
    [[nodiscard]] bool IsInput() const { return direction_ == PortDirection::Input; }
    [[nodiscard]] bool IsOutput() const { return direction_ == PortDirection::Output; }
    [[nodiscard]] PortId Id() const { return id_; }

    /// "owner.name" (or just name for an unowned port)
    [[nodiscard]] std::string FullName() const {
        return owner_.empty() ? name_ : owner_ + "." + name_;
    }

    [[nodiscard]] double Read() const { return signal_->Read(); }
    void Write(double value) { signal_->Write(value); }

    /// Replace this port's signal with a shared one
    void BindSignal(std::shared_ptr<Signal> signal) {
        if (!signal) {
            throw WiringError("cannot bind null signal to port '" + FullName() + "'");
        }
        signal_ = std::move(signal);
    }

    [[nodiscard]] const std::shared_ptr<Signal> &GetSignal() const { return signal_; }

  private:
    static PortId NextId() {
        static std::atomic<PortId> counter{0};
        return ++counter;
    }

    std::string name_;
    std::string owner_;
    PortDirection direction_;
    PortId id_;
    std::shared_ptr<Signal> signal_;
};

// =============================================================================
// PortMap
// =============================================================================

/**
 * @brief Name-keyed, insertion-ordered port table
 *
 * Order matters for enumerated ports (in0..inN, a0..aN). A PortMap either
 * owns its ports (created with Create) or aliases ports owned elsewhere
 * (Alias), as subcircuit wrappers do for their exposed tables.
 */
class PortMap {
  public:
    struct Entry {
        std::string key;
        Port *port;
    };

    explicit PortMap(PortDirection direction) : direction_(direction) {}

    PortMap(const PortMap &) = delete;
    PortMap &operator=(const PortMap &) = delete;
    PortMap(PortMap &&) noexcept = default;
    PortMap &operator=(PortMap &&) noexcept = default;

    /**
     * @brief Create and own a new port
     * @throws WiringError if the key is already present
     */
    Port &Create(const std::string &name, const std::string &owner) {
        CheckUnique(name);
        owned_.push_back(std::make_unique<Port>(name, direction_, owner));
        entries_.push_back({name, owned_.back().get()});
        return *owned_.back();
    }

    /**
     * @brief Expose a port owned elsewhere under the given key
     * @throws WiringError if the key is present or the port's direction differs
     */
    void Alias(const std::string &key, Port &port) {
        CheckUnique(key);
        if (port.Direction() != direction_) {
            throw WiringError("cannot alias " + std::string(ToString(port.Direction())) +
                              " port '" + port.FullName() + "' as " + ToString(direction_) +
                              " '" + key + "'");
        }
        entries_.push_back({key, &port});
    }

    [[nodiscard]] Port *Find(const std::string &key) const {
        for (const auto &e : entries_) {
            if (e.key == key)
                return e.port;
        }
        return nullptr;
    }

    [[nodiscard]] bool Contains(const std::string &key) const { return Find(key) != nullptr; }

    /// Lookup that throws UnknownPort naming the owning component
    [[nodiscard]] Port &At(const std::string &key, const std::string &component) const {
        Port *p = Find(key);
        if (p == nullptr) {
            throw CircuitError::UnknownPort(component, key,
                                            direction_ == PortDirection::Output);
        }
        return *p;
    }

    [[nodiscard]] std::vector<std::string> Keys() const {
        std::vector<std::string> keys;
        keys.reserve(entries_.size());
        for (const auto &e : entries_)
            keys.push_back(e.key);
        return keys;
    }

    [[nodiscard]] std::size_t Size() const { return entries_.size(); }
    [[nodiscard]] bool Empty() const { return entries_.empty(); }
    [[nodiscard]] PortDirection Direction() const { return direction_; }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

  private:
    void CheckUnique(const std::string &key) const {
        if (Contains(key)) {
            throw WiringError("duplicate " + std::string(ToString(direction_)) + " port '" + key +
                              "'");
        }
    }

    PortDirection direction_;
    std::vector<Entry> entries_;
    std::vector<std::unique_ptr<Port>> owned_;
};

} // namespace philbrick
