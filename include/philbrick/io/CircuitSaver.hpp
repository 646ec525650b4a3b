#pragma once

/**
 * @file CircuitSaver.hpp
 * @brief Writes a live machine and patch bay back to the declarative schema
 *
 * Only primitives are written; subcircuit wrappers are skipped because
 * their internals are already in the machine under flattened names. The
 * loader splits circuit-level references on the last dot, so flattened
 * names such as "SM1.EXP0" load back unchanged.
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/io/CircuitConfig.hpp>
#include <philbrick/io/LogService.hpp>
#include <philbrick/signal/PatchBay.hpp>
#include <philbrick/sim/Machine.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

namespace philbrick {

class CircuitSaver {
  public:
    /**
     * @brief Declaration of every primitive and every patch
     */
    static CircuitConfig ToConfig(const Machine &machine, const PatchBay &patchbay,
                                  const std::string &name = "circuit",
                                  const std::string &description = "") {
        CircuitConfig cfg;
        cfg.name = name;
        cfg.description = description;
        cfg.simulation.dt = machine.Dt();

        for (const auto &comp : machine.Components()) {
            if (comp->IsComposite()) {
                continue;
            }
            cfg.components.push_back(comp->ToConfig());
        }
        for (const auto &conn : patchbay.GetConnections()) {
            cfg.patches.emplace_back(conn.source->FullName(), conn.dest->FullName());
        }
        return cfg;
    }

    /**
     * @brief As above, keeping the circuit's name, scope and run settings
     */
    static CircuitConfig ToConfig(const Circuit &circuit) {
        auto cfg = ToConfig(circuit.machine, circuit.patchbay, circuit.name, circuit.description);
        cfg.scope = circuit.scope;
        cfg.simulation = circuit.simulation;
        return cfg;
    }

    /**
     * @brief Emit a config as YAML text
     *
     * Subcircuit templates and imports are not emitted: the components are
     * written flattened.
     */
    static std::string ToYaml(const CircuitConfig &cfg) {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << cfg.name;
        out << YAML::Key << "description" << YAML::Value << cfg.description;

        out << YAML::Key << "components" << YAML::Value << YAML::BeginSeq;
        for (const auto &comp : cfg.components) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << comp.name;
            out << YAML::Key << "type" << YAML::Value << comp.type;
            if (!comp.Empty()) {
                out << YAML::Key << "params" << YAML::Value;
                EmitParams(out, comp);
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        out << YAML::Key << "patches" << YAML::Value << YAML::BeginSeq;
        for (const auto &[src, dst] : cfg.patches) {
            out << YAML::Flow << YAML::BeginSeq << src << dst << YAML::EndSeq;
        }
        out << YAML::EndSeq;

        if (!cfg.scope.Empty()) {
            out << YAML::Key << "scope" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "channels" << YAML::Value << YAML::BeginSeq;
            for (const auto &ch : cfg.scope.channels) {
                out << YAML::Flow << YAML::BeginMap;
                out << YAML::Key << "source" << YAML::Value << ch.source;
                if (!ch.label.empty()) {
                    out << YAML::Key << "label" << YAML::Value << ch.label;
                }
                out << YAML::EndMap;
            }
            out << YAML::EndSeq << YAML::EndMap;
        }

        out << YAML::Key << "simulation" << YAML::Value << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "dt" << YAML::Value << cfg.simulation.dt;
        out << YAML::Key << "steps" << YAML::Value << cfg.simulation.steps;
        out << YAML::EndMap;

        out << YAML::EndMap;
        return std::string(out.c_str()) + "\n";
    }

    /**
     * @brief Write a config to a YAML file
     * @throws IOError if the file cannot be written
     */
    static void Save(const CircuitConfig &cfg, const std::string &path) {
        std::ofstream file(path);
        if (!file) {
            throw IOError("write", path, "cannot open for writing");
        }
        file << ToYaml(cfg);
        if (!file) {
            throw IOError("write", path, "write failed");
        }
        PHILBRICK_LOG_INFO(0.0, "Saved circuit '" + cfg.name + "' to " + path + " (" +
                                    std::to_string(cfg.components.size()) + " components, " +
                                    std::to_string(cfg.patches.size()) + " patches)");
    }

    static void Save(const Machine &machine, const PatchBay &patchbay, const std::string &path,
                     const std::string &name = "circuit", const std::string &description = "") {
        Save(ToConfig(machine, patchbay, name, description), path);
    }

  private:
    static void EmitParams(YAML::Emitter &out, const ComponentConfig &comp) {
        auto keys = comp.Keys();
        std::sort(keys.begin(), keys.end());

        out << YAML::BeginMap;
        for (const auto &key : keys) {
            out << YAML::Key << key << YAML::Value;
            if (auto it = comp.integers.find(key); it != comp.integers.end()) {
                out << it->second;
            } else if (auto sit = comp.scalars.find(key); sit != comp.scalars.end()) {
                out << sit->second;
            } else if (auto ait = comp.arrays.find(key); ait != comp.arrays.end()) {
                out << YAML::Flow << YAML::BeginSeq;
                for (double v : ait->second) {
                    out << v;
                }
                out << YAML::EndSeq;
            } else if (auto tit = comp.tables.find(key); tit != comp.tables.end()) {
                out << YAML::Flow << YAML::BeginSeq;
                for (const auto &[x, y] : tit->second) {
                    out << YAML::Flow << YAML::BeginSeq << x << y << YAML::EndSeq;
                }
                out << YAML::EndSeq;
            } else if (auto bit = comp.booleans.find(key); bit != comp.booleans.end()) {
                out << bit->second;
            } else {
                out << comp.strings.at(key);
            }
        }
        out << YAML::EndMap;
    }
};

} // namespace philbrick
