#pragma once

/**
 * @file PortRef.hpp
 * @brief Parsing of "component.port" references
 *
 * Two split rules coexist. Template-local references (subcircuit patches and
 * port maps) name a local component that never contains a dot, so they split
 * on the first dot. Circuit-level references (patches, scope channels, saved
 * files) may name flattened components such as "outer.inner.leaf", so they
 * split on the last dot.
 */

#include <philbrick/core/Error.hpp>

#include <string>

namespace philbrick {

/// Which dot separates the component part from the port part
enum class SplitRule {
    FirstDot, ///< "A.b.c" -> ("A", "b.c")
    LastDot   ///< "A.b.c" -> ("A.b", "c")
};

/**
 * @brief A parsed port reference
 */
struct PortRef {
    std::string component;
    std::string port;

    [[nodiscard]] std::string ToString() const { return component + "." + port; }

    bool operator==(const PortRef &) const = default;
};

/**
 * @brief Split a reference into component and port parts
 *
 * @throws CircuitError(MalformedReference) if there is no dot or either side is empty
 */
inline PortRef ParsePortRef(const std::string &ref, SplitRule rule) {
    auto pos = (rule == SplitRule::FirstDot) ? ref.find('.') : ref.rfind('.');
    if (pos == std::string::npos || pos == 0 || pos + 1 == ref.size()) {
        throw CircuitError::MalformedReference(ref);
    }
    return PortRef{ref.substr(0, pos), ref.substr(pos + 1)};
}

} // namespace philbrick
