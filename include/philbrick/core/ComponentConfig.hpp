#pragma once

/**
 * @file ComponentConfig.hpp
 * @brief Configuration container for components with typed accessors
 *
 * Carries one component declaration (name, type, params) from the loader
 * or the subcircuit composer into the registry. Primitive constructors
 * read their parameters through the typed accessors.
 */

#include <philbrick/core/Error.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace philbrick {

/// Ordered (x, y) pairs, e.g. PiecewiseLinear breakpoints
using Table = std::vector<std::pair<double, double>>;

/**
 * @brief Configuration container for components
 *
 * Example usage in a registry creator:
 * @code
 * auto gain = cfg.Get<double>("gain", 1.0);             // With default
 * auto freq = cfg.Require<double>("frequency");         // Throws if missing
 * auto weights = cfg.Get<std::vector<double>>("weights", {1.0, 1.0});
 * @endcode
 */
struct ComponentConfig {
    // =========================================================================
    // Identity (set by loader/composer)
    // =========================================================================

    std::string name; ///< Component instance name (possibly dotted, e.g. "SM1.EXP0")
    std::string type; ///< Component type name (primitive or subcircuit)

    // =========================================================================
    // Raw Storage (populated by loader)
    // =========================================================================

    std::unordered_map<std::string, double> scalars;
    std::unordered_map<std::string, std::vector<double>> arrays;
    std::unordered_map<std::string, Table> tables;
    std::unordered_map<std::string, std::string> strings;
    std::unordered_map<std::string, int64_t> integers;
    std::unordered_map<std::string, bool> booleans;

    // =========================================================================
    // Typed Accessors
    // =========================================================================

    /**
     * @brief Get a required config value (throws if missing)
     * @throws ConfigError if key is missing
     */
    template <typename T> T Require(const std::string &key) const;

    /**
     * @brief Get an optional config value with default
     */
    template <typename T> T Get(const std::string &key, const T &default_value) const;

    /**
     * @brief Check if a key exists in the storage for T
     */
    template <typename T> [[nodiscard]] bool Has(const std::string &key) const;

    /// Check if a key exists in any storage
    [[nodiscard]] bool HasKey(const std::string &key) const {
        return scalars.contains(key) || arrays.contains(key) || tables.contains(key) ||
               strings.contains(key) || integers.contains(key) || booleans.contains(key);
    }

    /// All parameter keys across storages (unordered, duplicates removed)
    [[nodiscard]] std::vector<std::string> Keys() const {
        std::vector<std::string> keys;
        auto add = [&keys](const std::string &k) {
            for (const auto &existing : keys) {
                if (existing == k)
                    return;
            }
            keys.push_back(k);
        };
        for (const auto &[k, v] : scalars)
            add(k);
        for (const auto &[k, v] : integers)
            add(k);
        for (const auto &[k, v] : arrays)
            add(k);
        for (const auto &[k, v] : tables)
            add(k);
        for (const auto &[k, v] : strings)
            add(k);
        for (const auto &[k, v] : booleans)
            add(k);
        return keys;
    }

    /// True when no parameters are set
    [[nodiscard]] bool Empty() const {
        return scalars.empty() && arrays.empty() && tables.empty() && strings.empty() &&
               integers.empty() && booleans.empty();
    }

    // =========================================================================
    // Setters (used by components when exporting their parameters)
    // =========================================================================

    void SetScalar(const std::string &key, double value) { scalars[key] = value; }

    /// Integer parameters are mirrored into scalars so Get<double> sees them too
    void SetInteger(const std::string &key, int64_t value) {
        integers[key] = value;
        scalars[key] = static_cast<double>(value);
    }

    void SetArray(const std::string &key, std::vector<double> value) {
        arrays[key] = std::move(value);
    }

    void SetTable(const std::string &key, Table value) { tables[key] = std::move(value); }
};

// =============================================================================
// Template Specializations - double
// =============================================================================

template <>
inline double ComponentConfig::Get<double>(const std::string &key, const double &def) const {
    auto it = scalars.find(key);
    return (it != scalars.end()) ? it->second : def;
}

template <> inline double ComponentConfig::Require<double>(const std::string &key) const {
    auto it = scalars.find(key);
    if (it == scalars.end()) {
        throw ConfigError("Component '" + name + "' missing required scalar: " + key);
    }
    return it->second;
}

template <> inline bool ComponentConfig::Has<double>(const std::string &key) const {
    return scalars.contains(key);
}

// =============================================================================
// Template Specializations - int / int64_t
// =============================================================================

template <> inline int ComponentConfig::Get<int>(const std::string &key, const int &def) const {
    auto it = integers.find(key);
    return (it != integers.end()) ? static_cast<int>(it->second) : def;
}

template <> inline int ComponentConfig::Require<int>(const std::string &key) const {
    auto it = integers.find(key);
    if (it == integers.end()) {
        throw ConfigError("Component '" + name + "' missing required integer: " + key);
    }
    return static_cast<int>(it->second);
}

template <> inline bool ComponentConfig::Has<int>(const std::string &key) const {
    return integers.contains(key);
}

template <>
inline int64_t ComponentConfig::Get<int64_t>(const std::string &key, const int64_t &def) const {
    auto it = integers.find(key);
    return (it != integers.end()) ? it->second : def;
}

template <> inline bool ComponentConfig::Has<int64_t>(const std::string &key) const {
    return integers.contains(key);
}

// =============================================================================
// Template Specializations - bool
// =============================================================================

template <> inline bool ComponentConfig::Get<bool>(const std::string &key, const bool &def) const {
    auto it = booleans.find(key);
    return (it != booleans.end()) ? it->second : def;
}

// =============================================================================
// Template Specializations - std::string
// =============================================================================

template <>
inline std::string ComponentConfig::Get<std::string>(const std::string &key,
                                                     const std::string &def) const {
    auto it = strings.find(key);
    return (it != strings.end()) ? it->second : def;
}

template <> inline std::string ComponentConfig::Require<std::string>(const std::string &key) const {
    auto it = strings.find(key);
    if (it == strings.end()) {
        throw ConfigError("Component '" + name + "' missing required string: " + key);
    }
    return it->second;
}

template <> inline bool ComponentConfig::Has<std::string>(const std::string &key) const {
    return strings.contains(key);
}

// =============================================================================
// Template Specializations - std::vector<double>
// =============================================================================

template <>
inline std::vector<double>
ComponentConfig::Get<std::vector<double>>(const std::string &key,
                                          const std::vector<double> &def) const {
    auto it = arrays.find(key);
    return (it != arrays.end()) ? it->second : def;
}

template <>
inline std::vector<double>
ComponentConfig::Require<std::vector<double>>(const std::string &key) const {
    auto it = arrays.find(key);
    if (it == arrays.end()) {
        throw ConfigError("Component '" + name + "' missing required array: " + key);
    }
    return it->second;
}

template <> inline bool ComponentConfig::Has<std::vector<double>>(const std::string &key) const {
    return arrays.contains(key);
}

// =============================================================================
// Template Specializations - Table
// =============================================================================

template <>
inline Table ComponentConfig::Get<Table>(const std::string &key, const Table &def) const {
    auto it = tables.find(key);
    return (it != tables.end()) ? it->second : def;
}

template <> inline Table ComponentConfig::Require<Table>(const std::string &key) const {
    auto it = tables.find(key);
    if (it == tables.end()) {
        throw ConfigError("Component '" + name + "' missing required table: " + key);
    }
    return it->second;
}

template <> inline bool ComponentConfig::Has<Table>(const std::string &key) const {
    return tables.contains(key);
}

} // namespace philbrick
