#pragma once

/**
 * @file CircuitLoader.hpp
 * @brief YAML loader for circuit and subcircuit definitions
 *
 * Parses the declarative schema with yaml-cpp. Component params are stored
 * by the shape of their YAML value:
 * - number            -> scalars (an integer literal also goes to integers)
 * - [numbers]         -> arrays
 * - [[x, y], ...]     -> tables
 * - bool              -> booleans
 * - anything else     -> strings
 *
 * Imports are subcircuit files resolved relative to the circuit file's
 * directory and keyed by their own `name` field.
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/core/ErrorLogging.hpp>
#include <philbrick/io/CircuitConfig.hpp>
#include <philbrick/io/LogService.hpp>

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace philbrick {

/**
 * @brief Loads CircuitConfig / SubcircuitTemplate from YAML
 *
 * Example usage:
 * @code
 * auto config = CircuitLoader::Load("circuits/oscillator.yaml");
 * auto circuit = CircuitBuilder(ComponentRegistry::WithBuiltins()).Build(config);
 * @endcode
 */
class CircuitLoader {
  public:
    // =========================================================================
    // Main Loading Methods
    // =========================================================================

    /**
     * @brief Load a circuit file, resolving imports relative to its directory
     *
     * @throws IOError if the file does not exist
     * @throws ConfigError on YAML or schema errors
     * @throws CircuitError(DuplicateRegistration) on subcircuit name collisions
     *
     * Failures are logged against the file before they propagate.
     */
    static CircuitConfig Load(const std::string &path) {
        CircuitConfig cfg;
        try {
            RequireFile(path);
            YAML::Node root;
            try {
                root = YAML::LoadFile(path);
            } catch (const YAML::Exception &e) {
                throw ConfigError(e.msg, path, e.mark.line >= 0 ? e.mark.line + 1 : -1);
            }
            auto base_dir = std::filesystem::path(path).parent_path().string();
            cfg = ParseRoot(root, path, base_dir);
        } catch (const Error &e) {
            LogError(e, 0.0, path);
            throw;
        }

        PHILBRICK_LOG_INFO(0.0, "Loaded circuit '" + cfg.name + "' from " + path + " (" +
                                    std::to_string(cfg.components.size()) + " components, " +
                                    std::to_string(cfg.patches.size()) + " patches, " +
                                    std::to_string(cfg.subcircuits.size()) + " subcircuits)");
        return cfg;
    }

    /**
     * @brief Parse a circuit from YAML text
     *
     * @param yaml_content YAML document
     * @param base_dir Directory that relative imports resolve against
     */
    static CircuitConfig Parse(const std::string &yaml_content, const std::string &base_dir = "") {
        YAML::Node root;
        try {
            root = YAML::Load(yaml_content);
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.msg, "<string>", e.mark.line >= 0 ? e.mark.line + 1 : -1);
        }
        return ParseRoot(root, "<string>", base_dir);
    }

    /**
     * @brief Load a standalone subcircuit definition file
     */
    static SubcircuitTemplate LoadSubcircuit(const std::string &path) {
        RequireFile(path);
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::Exception &e) {
            throw ConfigError(e.msg, path, e.mark.line >= 0 ? e.mark.line + 1 : -1);
        }
        auto tmpl = ParseSubcircuit(root, path, "");
        if (tmpl.name.empty()) {
            throw ConfigError("Subcircuit file has no 'name'", path);
        }
        return tmpl;
    }

    /**
     * @brief Parse a subcircuitDef node
     *
     * @param fallback_name Name used when the node has no `name` field
     */
    static SubcircuitTemplate ParseSubcircuit(const YAML::Node &node, const std::string &source,
                                              const std::string &fallback_name) {
        if (!node.IsMap()) {
            throw ConfigError("Subcircuit definition must be a map", source, Line(node));
        }
        SubcircuitTemplate t;
        t.name = GetString(node, "name", fallback_name);
        t.description = GetString(node, "description", "");
        t.inputs = GetStringList(node, "inputs", source);
        t.outputs = GetStringList(node, "outputs", source);
        if (node["components"]) {
            ParseComponentList(t.components, node["components"], source);
        }
        if (node["patches"]) {
            ParsePatchList(t.patches, node["patches"], source);
        }
        ParseStringMap(t.input_map, node["input_map"], source);
        ParseStringMap(t.output_map, node["output_map"], source);
        return t;
    }

    /**
     * @brief Parse a single componentDecl node
     */
    static ComponentConfig ParseComponent(const YAML::Node &node, const std::string &source) {
        if (!node.IsMap()) {
            throw ConfigError("Component declaration must be a map", source, Line(node));
        }
        ComponentConfig cfg;
        cfg.name = RequireString(node, "name", source);
        cfg.type = RequireString(node, "type", source);

        const YAML::Node params = node["params"];
        if (params && !params.IsNull()) {
            if (!params.IsMap()) {
                throw ConfigError("'params' of component '" + cfg.name + "' must be a map", source,
                                  Line(params));
            }
            for (const auto &entry : params) {
                ParseParam(cfg, entry.first.as<std::string>(), entry.second, source);
            }
        }
        return cfg;
    }

  private:
    // =========================================================================
    // Root Parsing
    // =========================================================================

    static CircuitConfig ParseRoot(const YAML::Node &root, const std::string &source,
                                   const std::string &base_dir) {
        if (!root.IsMap()) {
            throw ConfigError("Circuit document must be a map", source);
        }

        CircuitConfig cfg;
        cfg.source_file = source;
        cfg.name = RequireString(root, "name", source);
        cfg.description = GetString(root, "description", "");

        if (root["components"]) {
            ParseComponentList(cfg.components, root["components"], source);
        }
        if (root["patches"]) {
            ParsePatchList(cfg.patches, root["patches"], source);
        }
        if (root["scope"]) {
            ParseScope(cfg.scope, root["scope"], source);
        }
        if (root["simulation"]) {
            ParseSimulation(cfg.simulation, root["simulation"], source);
        }

        std::set<std::string> sub_names;
        const YAML::Node subs = root["subcircuits"];
        if (subs && !subs.IsNull()) {
            if (!subs.IsMap()) {
                throw ConfigError("'subcircuits' must be a map of name -> definition", source,
                                  Line(subs));
            }
            for (const auto &entry : subs) {
                auto key = entry.first.as<std::string>();
                auto tmpl = ParseSubcircuit(entry.second, source, key);
                if (tmpl.name != key) {
                    PHILBRICK_LOG_WARN(0.0, "Subcircuit '" + key + "' declares name '" +
                                                tmpl.name + "'; registering under '" + key +
                                                "'");
                    tmpl.name = key;
                }
                if (!sub_names.insert(key).second) {
                    throw CircuitError::DuplicateRegistration(key);
                }
                cfg.subcircuits.push_back(std::move(tmpl));
            }
        }

        cfg.imports = GetStringList(root, "imports", source);
        for (const auto &entry : cfg.imports) {
            std::filesystem::path import_path(entry);
            if (import_path.is_relative() && !base_dir.empty()) {
                import_path = std::filesystem::path(base_dir) / import_path;
            }
            auto tmpl = LoadSubcircuit(import_path.string());
            if (!sub_names.insert(tmpl.name).second) {
                throw CircuitError::DuplicateRegistration(tmpl.name);
            }
            PHILBRICK_LOG_DEBUG(0.0, "Imported subcircuit '" + tmpl.name + "' from " +
                                         import_path.string());
            cfg.subcircuits.push_back(std::move(tmpl));
        }

        auto errors = cfg.Validate();
        if (!errors.empty()) {
            std::string msg = "Circuit '" + cfg.name + "' is invalid:";
            for (const auto &err : errors) {
                msg += "\n  - " + err;
            }
            throw ConfigError(msg, source);
        }
        return cfg;
    }

    static void ParseComponentList(std::vector<ComponentConfig> &components,
                                   const YAML::Node &node, const std::string &source) {
        if (node.IsNull()) {
            return;
        }
        if (!node.IsSequence()) {
            throw ConfigError("'components' must be a list", source, Line(node));
        }
        for (const auto &comp_node : node) {
            components.push_back(ParseComponent(comp_node, source));
        }
    }

    /// Patches are [src, dst] pairs or {source, dest} maps
    static void ParsePatchList(std::vector<PatchDecl> &patches, const YAML::Node &node,
                               const std::string &source) {
        if (node.IsNull()) {
            return;
        }
        if (!node.IsSequence()) {
            throw ConfigError("'patches' must be a list", source, Line(node));
        }
        for (const auto &patch : node) {
            if (patch.IsSequence()) {
                if (patch.size() != 2) {
                    throw ConfigError("Patch must have exactly 2 elements, got " +
                                          std::to_string(patch.size()),
                                      source, Line(patch));
                }
                patches.emplace_back(patch[0].as<std::string>(), patch[1].as<std::string>());
            } else if (patch.IsMap()) {
                patches.emplace_back(RequireString(patch, "source", source),
                                     RequireString(patch, "dest", source));
            } else {
                throw ConfigError("Patch must be [source, dest]", source, Line(patch));
            }
        }
    }

    static void ParseScope(ScopeConfig &scope, const YAML::Node &node,
                           const std::string &source) {
        if (node.IsNull() || !node["channels"]) {
            return;
        }
        const YAML::Node channels = node["channels"];
        if (!channels.IsSequence()) {
            throw ConfigError("'scope.channels' must be a list", source, Line(channels));
        }
        for (const auto &ch : channels) {
            ScopeChannel channel;
            if (ch.IsScalar()) {
                channel.source = ch.as<std::string>();
            } else {
                channel.source = RequireString(ch, "source", source);
                channel.label = GetString(ch, "label", "");
            }
            scope.channels.push_back(channel);
        }
    }

    static void ParseSimulation(SimulationConfig &sim, const YAML::Node &node,
                                const std::string &source) {
        if (node.IsNull()) {
            return;
        }
        try {
            if (node["dt"]) {
                sim.dt = node["dt"].as<double>();
            }
            if (node["steps"]) {
                sim.steps = node["steps"].as<int64_t>();
            }
        } catch (const YAML::Exception &e) {
            throw ConfigError("Invalid 'simulation' section: " + e.msg, source, Line(node));
        }
    }

    // =========================================================================
    // Parameter Shapes
    // =========================================================================

    static void ParseParam(ComponentConfig &cfg, const std::string &key, const YAML::Node &value,
                           const std::string &source) {
        if (value.IsScalar()) {
            // Quoted scalars carry the non-specific tag "!" and stay strings
            if (value.Tag() != "!") {
                int64_t i = 0;
                double d = 0.0;
                bool b = false;
                if (YAML::convert<int64_t>::decode(value, i)) {
                    cfg.integers[key] = i;
                    cfg.scalars[key] = static_cast<double>(i);
                    return;
                }
                if (YAML::convert<double>::decode(value, d)) {
                    cfg.scalars[key] = d;
                    return;
                }
                if (YAML::convert<bool>::decode(value, b)) {
                    cfg.booleans[key] = b;
                    return;
                }
            }
            cfg.strings[key] = value.as<std::string>();
            return;
        }

        if (value.IsSequence()) {
            if (value.size() > 0 && value[0].IsSequence()) {
                Table table;
                for (const auto &row : value) {
                    if (!row.IsSequence() || row.size() != 2) {
                        throw ConfigError("Param '" + key + "' of component '" + cfg.name +
                                              "' must be a list of [x, y] pairs",
                                          source, Line(row));
                    }
                    table.emplace_back(AsNumber(row[0], cfg.name, key, source),
                                       AsNumber(row[1], cfg.name, key, source));
                }
                cfg.tables[key] = std::move(table);
                return;
            }
            std::vector<double> values;
            values.reserve(value.size());
            for (const auto &v : value) {
                values.push_back(AsNumber(v, cfg.name, key, source));
            }
            cfg.arrays[key] = std::move(values);
            return;
        }

        throw ConfigError("Param '" + key + "' of component '" + cfg.name +
                              "' must be a number, string, bool or list",
                          source, Line(value));
    }

    static double AsNumber(const YAML::Node &node, const std::string &component,
                           const std::string &key, const std::string &source) {
        double d = 0.0;
        if (!node.IsScalar() || !YAML::convert<double>::decode(node, d)) {
            throw ConfigError("Param '" + key + "' of component '" + component +
                                  "' must contain only numbers",
                              source, Line(node));
        }
        return d;
    }

    // =========================================================================
    // Node Helpers
    // =========================================================================

    static void RequireFile(const std::string &path) {
        if (!std::filesystem::exists(path)) {
            throw IOError("read", path, "no such file");
        }
    }

    static int Line(const YAML::Node &node) {
        return node.Mark().line >= 0 ? node.Mark().line + 1 : -1;
    }

    static std::string RequireString(const YAML::Node &node, const std::string &key,
                                     const std::string &source) {
        const YAML::Node value = node[key];
        if (!value || !value.IsScalar()) {
            throw ConfigError("Missing required field '" + key + "'", source, Line(node));
        }
        return value.as<std::string>();
    }

    static std::string GetString(const YAML::Node &node, const std::string &key,
                                 const std::string &def) {
        const YAML::Node value = node[key];
        if (!value || !value.IsScalar()) {
            return def;
        }
        return value.as<std::string>();
    }

    static std::vector<std::string> GetStringList(const YAML::Node &node, const std::string &key,
                                                  const std::string &source) {
        std::vector<std::string> result;
        const YAML::Node value = node[key];
        if (!value || value.IsNull()) {
            return result;
        }
        if (!value.IsSequence()) {
            throw ConfigError("'" + key + "' must be a list", source, Line(value));
        }
        for (const auto &item : value) {
            result.push_back(item.as<std::string>());
        }
        return result;
    }

    static void ParseStringMap(std::map<std::string, std::string> &out, const YAML::Node &node,
                               const std::string &source) {
        if (!node || node.IsNull()) {
            return;
        }
        if (!node.IsMap()) {
            throw ConfigError("Port map must be a map of name -> 'component.port'", source,
                              Line(node));
        }
        for (const auto &entry : node) {
            out[entry.first.as<std::string>()] = entry.second.as<std::string>();
        }
    }
};

} // namespace philbrick
