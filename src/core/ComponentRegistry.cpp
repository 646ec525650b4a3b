/**
 * @file ComponentRegistry.cpp
 * @brief Type registry implementation
 */

#include <philbrick/core/ComponentRegistry.hpp>
#include <philbrick/core/Error.hpp>
#include <philbrick/io/LogService.hpp>
#include <philbrick/sim/Machine.hpp>
#include <philbrick/signal/PatchBay.hpp>

#include <algorithm>
#include <utility>

namespace philbrick {

ComponentRegistry::ComponentRegistry() {
    for (const auto &spec : PrimitiveCatalog()) {
        primitives_.emplace(spec.type_name, spec);
    }
}

// =============================================================================
// Registration
// =============================================================================

void ComponentRegistry::Register(const std::string &type_name, SubcircuitTemplate tmpl) {
    if (type_name.empty()) {
        throw ConfigError("Subcircuit template has no name");
    }
    if (HasType(type_name)) {
        throw CircuitError::DuplicateRegistration(type_name);
    }
    tmpl.name = type_name;
    CheckAcyclic(type_name, tmpl);

    PHILBRICK_LOG_DEBUG(0.0, "Registered subcircuit '" + type_name + "' (" +
                                 std::to_string(tmpl.components.size()) + " components)");
    templates_.emplace(type_name, std::move(tmpl));
}

void ComponentRegistry::Register(SubcircuitTemplate tmpl) {
    std::string type_name = tmpl.name;
    Register(type_name, std::move(tmpl));
}

void ComponentRegistry::CheckAcyclic(const std::string &type_name,
                                     const SubcircuitTemplate &tmpl) const {
    // Depth-first walk from the new template through already registered
    // templates. The chain holds the current expansion path.
    std::vector<std::string> chain{type_name};

    std::function<void(const SubcircuitTemplate &)> visit = [&](const SubcircuitTemplate &t) {
        for (const auto &decl : t.components) {
            if (decl.type == type_name) {
                std::string path;
                for (const auto &step : chain) {
                    path += step + " -> ";
                }
                path += type_name;
                throw CircuitError::CyclicTemplate(type_name, path);
            }
            auto it = templates_.find(decl.type);
            if (it == templates_.end()) {
                continue;
            }
            // Already on the path: a cycle not involving the new name, which
            // registration would have rejected earlier
            if (std::find(chain.begin(), chain.end(), decl.type) != chain.end()) {
                continue;
            }
            chain.push_back(decl.type);
            visit(it->second);
            chain.pop_back();
        }
    };

    visit(tmpl);
}

// =============================================================================
// Creation
// =============================================================================

namespace {

const char *KindName(ParamKind kind) {
    switch (kind) {
    case ParamKind::Scalar:
        return "a number";
    case ParamKind::Count:
        return "a non-negative whole number";
    case ParamKind::Array:
        return "a list of numbers";
    case ParamKind::Table:
        return "a list of [x, y] pairs";
    }
    return "?";
}

bool HasShape(const ComponentConfig &config, const std::string &key, ParamKind kind) {
    switch (kind) {
    case ParamKind::Scalar:
        return config.Has<double>(key);
    case ParamKind::Count:
        return config.Has<int64_t>(key) || config.Has<double>(key);
    case ParamKind::Array:
        return config.Has<std::vector<double>>(key);
    case ParamKind::Table:
        return config.Has<Table>(key) ||
               (config.Has<std::vector<double>>(key) &&
                config.Get<std::vector<double>>(key, {}).empty());
    }
    return false;
}

} // namespace

void ComponentRegistry::CheckParams(const PrimitiveSpec &spec,
                                    const ComponentConfig &config) const {
    for (const auto &key : config.Keys()) {
        auto decl = std::find_if(spec.params.begin(), spec.params.end(),
                                 [&key](const ParamDecl &p) { return p.key == key; });
        if (decl == spec.params.end()) {
            std::string accepted;
            for (const auto &p : spec.params) {
                if (!accepted.empty())
                    accepted += ", ";
                accepted += p.key;
            }
            const std::string hint =
                accepted.empty() ? " (takes none)" : " (accepts: " + accepted + ")";
            throw CircuitError::ParameterMismatch(
                config.name, spec.type_name + " has no parameter '" + key + "'" + hint);
        }
        if (!HasShape(config, key, decl->kind)) {
            throw CircuitError::ParameterMismatch(config.name, spec.type_name + " parameter '" +
                                                                   key + "' must be " +
                                                                   KindName(decl->kind));
        }
    }
    for (const auto &key : spec.required) {
        if (!config.HasKey(key)) {
            throw CircuitError::ParameterMismatch(config.name, spec.type_name +
                                                                   " requires parameter '" + key +
                                                                   "'");
        }
    }
}

std::unique_ptr<Component> ComponentRegistry::Create(const ComponentConfig &config) const {
    auto it = primitives_.find(config.type);
    if (it == primitives_.end()) {
        if (IsSubcircuit(config.type)) {
            throw ConfigError("Subcircuit '" + config.type + "' for component '" + config.name +
                              "' needs a machine and patch bay to expand");
        }
        throw CircuitError::UnknownType(config.type, ListTypesString());
    }
    CheckParams(it->second, config);
    return it->second.creator(config);
}

std::unique_ptr<Component> ComponentRegistry::Create(const ComponentConfig &config,
                                                     Machine &machine,
                                                     PatchBay &patchbay) const {
    auto it = templates_.find(config.type);
    if (it == templates_.end()) {
        return Create(config);
    }
    if (!config.Empty()) {
        throw CircuitError::ParameterMismatch(config.name, "subcircuit '" + config.type +
                                                               "' takes no parameters");
    }
    ScopedLogContext ctx("", config.name);
    return InstantiateSubcircuit(it->second, config.name, *this, machine, patchbay);
}

// =============================================================================
// Queries
// =============================================================================

bool ComponentRegistry::HasType(const std::string &type_name) const {
    return IsPrimitive(type_name) || IsSubcircuit(type_name);
}

bool ComponentRegistry::IsPrimitive(const std::string &type_name) const {
    return primitives_.contains(type_name);
}

bool ComponentRegistry::IsSubcircuit(const std::string &type_name) const {
    return templates_.contains(type_name);
}

const SubcircuitTemplate &ComponentRegistry::GetTemplate(const std::string &type_name) const {
    auto it = templates_.find(type_name);
    if (it == templates_.end()) {
        throw CircuitError::UnknownType(type_name);
    }
    return it->second;
}

const PrimitiveSpec &ComponentRegistry::GetPrimitive(const std::string &type_name) const {
    auto it = primitives_.find(type_name);
    if (it == primitives_.end()) {
        throw CircuitError::UnknownType(type_name);
    }
    return it->second;
}

std::vector<std::string> ComponentRegistry::ListTypes() const {
    std::vector<std::string> types;
    types.reserve(NumRegistered());
    for (const auto &[name, spec] : primitives_) {
        types.push_back(name);
    }
    for (const auto &[name, tmpl] : templates_) {
        types.push_back(name);
    }
    std::sort(types.begin(), types.end());
    return types;
}

std::string ComponentRegistry::ListTypesString() const {
    std::string result;
    for (const auto &name : ListTypes()) {
        if (!result.empty())
            result += ", ";
        result += name;
    }
    return result.empty() ? "(none)" : result;
}

} // namespace philbrick
