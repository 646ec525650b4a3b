#pragma once

/**
 * @file IntrospectionGraph.hpp
 * @brief Component/port/patch graph for diagram tooling
 *
 * Nodes are the machine's primitives plus subcircuit instances; edges are
 * the patch bay's connections in insertion order.
 *
 * ## JSON Schema
 *
 * ```json
 * {
 *   "summary": { "total_components": 5, "total_subcircuits": 1, "total_edges": 6 },
 *   "components": [
 *     { "name": "SM1.EXP0", "type": "Exp", "inputs": ["in"], "outputs": ["out"],
 *       "params": { "scale": 1.0 } }
 *   ],
 *   "subcircuits": [
 *     { "name": "SM1", "type": "Softmax",
 *       "inputs": { "in0": "SM1.EXP0.in" }, "outputs": { "out0": "SM1.DIV0.out" } }
 *   ],
 *   "edges": [ { "source": "SM1.EXP0.out", "target": "SM1.SUM.in0" } ]
 * }
 * ```
 */

#include <philbrick/core/Error.hpp>
#include <philbrick/io/CircuitBuilder.hpp>
#include <philbrick/signal/PatchBay.hpp>
#include <philbrick/sim/Machine.hpp>
#include <philbrick/sim/Subcircuit.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <string>
#include <vector>

namespace philbrick {

/**
 * @brief A single directed patch edge
 */
struct IntrospectionEdge {
    std::string source; ///< "owner.port" of the output
    std::string target; ///< "owner.port" of the input
};

/**
 * @brief A component node with its port names and parameters
 */
struct IntrospectionNode {
    std::string name;
    std::string type;
    std::vector<std::string> inputs;
    std::vector<std::string> outputs;
    ComponentConfig params;
    bool composite = false;

    /// Exposed key -> aliased port full name (composite nodes only)
    std::vector<std::pair<std::string, std::string>> input_aliases;
    std::vector<std::pair<std::string, std::string>> output_aliases;
};

/**
 * @brief Complete introspection graph: nodes + edges
 */
struct IntrospectionGraph {
    std::string circuit;
    std::vector<IntrospectionNode> components;
    std::vector<IntrospectionNode> subcircuits;
    std::vector<IntrospectionEdge> edges;

    /**
     * @brief Snapshot a machine and patch bay
     */
    static IntrospectionGraph Capture(const Machine &machine, const PatchBay &patchbay,
                                      const std::string &circuit_name = "") {
        IntrospectionGraph g;
        g.circuit = circuit_name;
        for (const auto &comp : machine.Components()) {
            g.components.push_back(MakeNode(*comp));
        }
        for (const auto &conn : patchbay.GetConnections()) {
            g.edges.push_back({conn.source->FullName(), conn.dest->FullName()});
        }
        return g;
    }

    /**
     * @brief Snapshot a built circuit, subcircuit instances included
     *
     * Nested instances follow their outer wrapper, named "outer.inner".
     */
    static IntrospectionGraph Capture(const Circuit &circuit) {
        auto g = Capture(circuit.machine, circuit.patchbay, circuit.name);
        for (const auto &[name, wrapper] : circuit.subcircuits) {
            g.AddSubcircuit(*wrapper);
        }
        return g;
    }

    /**
     * @brief Serialize the graph to JSON
     */
    [[nodiscard]] nlohmann::json ToJSON() const {
        nlohmann::json j;
        j["circuit"] = circuit;
        j["summary"]["total_components"] = components.size();
        j["summary"]["total_subcircuits"] = subcircuits.size();
        j["summary"]["total_edges"] = edges.size();

        j["components"] = nlohmann::json::array();
        for (const auto &node : components) {
            nlohmann::json jnode;
            jnode["name"] = node.name;
            jnode["type"] = node.type;
            jnode["inputs"] = node.inputs;
            jnode["outputs"] = node.outputs;
            jnode["params"] = ParamsToJSON(node.params);
            j["components"].push_back(jnode);
        }

        j["subcircuits"] = nlohmann::json::array();
        for (const auto &node : subcircuits) {
            nlohmann::json jnode;
            jnode["name"] = node.name;
            jnode["type"] = node.type;
            jnode["inputs"] = nlohmann::json::object();
            for (const auto &[key, target] : node.input_aliases) {
                jnode["inputs"][key] = target;
            }
            jnode["outputs"] = nlohmann::json::object();
            for (const auto &[key, target] : node.output_aliases) {
                jnode["outputs"][key] = target;
            }
            j["subcircuits"].push_back(jnode);
        }

        j["edges"] = nlohmann::json::array();
        for (const auto &edge : edges) {
            j["edges"].push_back({{"source", edge.source}, {"target", edge.target}});
        }
        return j;
    }

    /**
     * @brief Write the graph to a JSON file
     * @throws IOError if the file cannot be written
     */
    void ToJSONFile(const std::string &path) const {
        std::ofstream file(path);
        if (!file) {
            throw IOError("write", path, "cannot open for writing");
        }
        file << ToJSON().dump(2) << "\n";
    }

  private:
    void AddSubcircuit(const Component &wrapper) {
        subcircuits.push_back(MakeNode(wrapper));
        if (const auto *sub = dynamic_cast<const SubcircuitComponent *>(&wrapper)) {
            for (const auto &nested : sub->Nested()) {
                AddSubcircuit(*nested);
            }
        }
    }

    static IntrospectionNode MakeNode(const Component &comp) {
        IntrospectionNode node;
        node.name = comp.Name();
        node.type = comp.TypeName();
        node.composite = comp.IsComposite();
        node.inputs = comp.Inputs().Keys();
        node.outputs = comp.Outputs().Keys();
        if (node.composite) {
            for (const auto &entry : comp.Inputs()) {
                node.input_aliases.emplace_back(entry.key, entry.port->FullName());
            }
            for (const auto &entry : comp.Outputs()) {
                node.output_aliases.emplace_back(entry.key, entry.port->FullName());
            }
        } else {
            node.params = comp.ToConfig();
        }
        return node;
    }

    static nlohmann::json ParamsToJSON(const ComponentConfig &cfg) {
        nlohmann::json j = nlohmann::json::object();
        for (const auto &[k, v] : cfg.scalars) {
            j[k] = v;
        }
        for (const auto &[k, v] : cfg.integers) {
            j[k] = v;
        }
        for (const auto &[k, v] : cfg.arrays) {
            j[k] = v;
        }
        for (const auto &[k, v] : cfg.tables) {
            nlohmann::json rows = nlohmann::json::array();
            for (const auto &[x, y] : v) {
                rows.push_back({x, y});
            }
            j[k] = rows;
        }
        for (const auto &[k, v] : cfg.strings) {
            j[k] = v;
        }
        for (const auto &[k, v] : cfg.booleans) {
            j[k] = v;
        }
        return j;
    }
};

} // namespace philbrick
