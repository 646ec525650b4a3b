#pragma once

/**
 * @file ComponentRegistry.hpp
 * @brief Type catalog mapping names to primitives and subcircuit templates
 *
 * The registry is a plain value: callers construct one and pass it to the
 * builder and composer. Copies are independent, so a circuit load can
 * register its own subcircuits into a scoped copy.
 */

#include <philbrick/core/Component.hpp>
#include <philbrick/core/ComponentConfig.hpp>
#include <philbrick/sim/Subcircuit.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace philbrick {

class Machine;
class PatchBay;

/**
 * @brief Storage a parameter value must arrive in
 */
enum class ParamKind {
    Scalar, ///< Number (integer literals are mirrored into scalars)
    Count,  ///< Non-negative whole number
    Array,  ///< List of numbers
    Table   ///< List of [x, y] pairs; an empty list is an empty table
};

/**
 * @brief One accepted parameter key and its expected shape
 */
struct ParamDecl {
    ParamDecl(const char *key_, ParamKind kind_ = ParamKind::Scalar) : key(key_), kind(kind_) {}

    std::string key;
    ParamKind kind;
};

/**
 * @brief Constructor entry for one primitive type
 */
struct PrimitiveSpec {
    /// Creator function type: takes the validated config, returns the component
    using Creator = std::function<std::unique_ptr<Component>(const ComponentConfig &)>;

    std::string type_name;
    Creator creator;
    std::vector<ParamDecl> params;     ///< Accepted parameter keys
    std::vector<std::string> required; ///< Keys that must be present
    std::string description;
};

/**
 * @brief The fixed primitive catalog (defined in components/registration.cpp)
 */
const std::vector<PrimitiveSpec> &PrimitiveCatalog();

/**
 * @brief Type registry for primitives and subcircuit templates
 *
 * Example:
 * @code
 * ComponentRegistry registry = ComponentRegistry::WithBuiltins();
 * Machine machine(0.01);
 * PatchBay bay;
 * auto sm = registry.Create({.name = "SM1", .type = "Softmax"}, machine, bay);
 * @endcode
 */
class ComponentRegistry {
  public:
    /// Registry seeded with the primitive catalog only
    ComponentRegistry();

    /// Primitives plus the built-in template library (Softmax, AttentionHead)
    static ComponentRegistry WithBuiltins();

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Register a subcircuit template under a type name
     *
     * Templates may reference templates that are not registered yet; such a
     * reference fails as UnknownType at expansion if never registered.
     *
     * @throws CircuitError(DuplicateRegistration) if the name is taken
     * @throws CircuitError(CyclicTemplate) if the template can reach itself
     */
    void Register(const std::string &type_name, SubcircuitTemplate tmpl);

    /// Register using the template's own name
    void Register(SubcircuitTemplate tmpl);

    // =========================================================================
    // Creation
    // =========================================================================

    /**
     * @brief Construct a primitive from its declaration
     *
     * @throws CircuitError(UnknownType) if the type is not registered
     * @throws CircuitError(ParameterMismatch) on unknown or missing params
     * @throws ConfigError if the type names a template (needs machine and patch bay)
     */
    [[nodiscard]] std::unique_ptr<Component> Create(const ComponentConfig &config) const;

    /**
     * @brief Construct a primitive or expand a template
     *
     * For a template, the internals are added to machine and wired in
     * patchbay; the returned component is the passive SubcircuitComponent.
     * For a primitive, the component is returned without being added.
     */
    [[nodiscard]] std::unique_ptr<Component> Create(const ComponentConfig &config,
                                                    Machine &machine, PatchBay &patchbay) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool HasType(const std::string &type_name) const;
    [[nodiscard]] bool IsPrimitive(const std::string &type_name) const;
    [[nodiscard]] bool IsSubcircuit(const std::string &type_name) const;

    /// @throws CircuitError(UnknownType) if not a registered template
    [[nodiscard]] const SubcircuitTemplate &GetTemplate(const std::string &type_name) const;

    /// @throws CircuitError(UnknownType) if not a primitive
    [[nodiscard]] const PrimitiveSpec &GetPrimitive(const std::string &type_name) const;

    /// Sorted union of primitive and template names
    [[nodiscard]] std::vector<std::string> ListTypes() const;

    [[nodiscard]] std::size_t NumRegistered() const {
        return primitives_.size() + templates_.size();
    }

  private:
    void CheckParams(const PrimitiveSpec &spec, const ComponentConfig &config) const;
    void CheckAcyclic(const std::string &type_name, const SubcircuitTemplate &tmpl) const;
    [[nodiscard]] std::string ListTypesString() const;

    std::map<std::string, PrimitiveSpec> primitives_;
    std::map<std::string, SubcircuitTemplate> templates_;
};

} // namespace philbrick
