#pragma once

/**
 * @file Error.hpp
 * @brief Consolidated error handling for Philbrick
 *
 * Provides a flattened exception hierarchy. Circuit construction failures
 * share one class with a kind enum rather than one subclass per failure.
 * Stepping never throws; numeric degeneracy is clamped inside components.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace philbrick {

// =============================================================================
// Error Severity
// =============================================================================

enum class Severity : uint8_t {
    INFO,    ///< Informational (logged, no action)
    WARNING, ///< Warning
    ERROR,   ///< Error (current build attempt fails)
    FATAL    ///< Fatal (programming error)
};

// =============================================================================
// Base Exception
// =============================================================================

/**
 * @brief Base class for all Philbrick exceptions
 *
 * All Philbrick exceptions carry a severity level (defaults to ERROR) and a
 * category string used as logging context.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg, Severity severity = Severity::ERROR,
                   std::string category = "general")
        : std::runtime_error("[philbrick] " + msg), severity_(severity),
          category_(std::move(category)) {}

    [[nodiscard]] Severity severity() const { return severity_; }
    [[nodiscard]] const std::string &category() const { return category_; }

  protected:
    Severity severity_;
    std::string category_;
};

// =============================================================================
// Circuit Construction Errors
// =============================================================================

/**
 * @brief Circuit construction error categories
 */
enum class CircuitErrorKind {
    UnknownType,           ///< Type name not in registry
    UnknownComponent,      ///< Reference names no component
    UnknownPort,           ///< Component has no such port
    MalformedReference,    ///< "component.port" did not split into two non-empty parts
    DuplicateRegistration, ///< Type name already registered
    PortMappingError,      ///< Subcircuit exposed port could not be mapped
    CyclicTemplate,        ///< Subcircuit template reaches itself
    ParameterMismatch      ///< Unknown or missing constructor parameter
};

/**
 * @brief Errors raised while registering types or building a circuit
 *
 * All kinds are fatal to the current build attempt.
 */
class CircuitError : public Error {
  public:
    CircuitError(CircuitErrorKind kind, const std::string &subject,
                 const std::string &detail = "")
        : Error(FormatMessage(kind, subject, detail), Severity::ERROR, "circuit"), kind_(kind),
          subject_(subject) {}

    [[nodiscard]] CircuitErrorKind kind() const { return kind_; }

    /// The type, component, port or reference the error is about
    [[nodiscard]] const std::string &subject() const { return subject_; }

    // Convenience factory methods
    static CircuitError UnknownType(const std::string &type_name,
                                    const std::string &registered = "") {
        return {CircuitErrorKind::UnknownType, type_name,
                registered.empty() ? "" : "registered types: " + registered};
    }

    static CircuitError UnknownComponent(const std::string &name,
                                         const std::string &context = "") {
        return {CircuitErrorKind::UnknownComponent, name, context};
    }

    static CircuitError UnknownPort(const std::string &component, const std::string &port,
                                    bool is_output) {
        return {CircuitErrorKind::UnknownPort, component + "." + port,
                "component '" + component + "' has no " + (is_output ? "output" : "input") +
                    " port '" + port + "'"};
    }

    static CircuitError MalformedReference(const std::string &ref) {
        return {CircuitErrorKind::MalformedReference, ref,
                "expected format 'component_name.port_name'"};
    }

    static CircuitError DuplicateRegistration(const std::string &type_name) {
        return {CircuitErrorKind::DuplicateRegistration, type_name, "already registered"};
    }

    static CircuitError PortMapping(const std::string &instance, const std::string &port,
                                    bool is_output) {
        return {CircuitErrorKind::PortMappingError, instance + "." + port,
                std::string("could not find ") + (is_output ? "output" : "input") + " port '" +
                    port + "' in subcircuit '" + instance + "'; use " +
                    (is_output ? "output_map" : "input_map") + " to specify the mapping"};
    }

    static CircuitError CyclicTemplate(const std::string &type_name, const std::string &chain) {
        return {CircuitErrorKind::CyclicTemplate, type_name, "expansion chain " + chain};
    }

    static CircuitError ParameterMismatch(const std::string &component,
                                          const std::string &detail) {
        return {CircuitErrorKind::ParameterMismatch, component, detail};
    }

  private:
    static std::string FormatMessage(CircuitErrorKind kind, const std::string &subject,
                                     const std::string &detail) {
        std::string prefix;
        switch (kind) {
        case CircuitErrorKind::UnknownType:
            prefix = "Unknown component type";
            break;
        case CircuitErrorKind::UnknownComponent:
            prefix = "Unknown component";
            break;
        case CircuitErrorKind::UnknownPort:
            prefix = "Unknown port";
            break;
        case CircuitErrorKind::MalformedReference:
            prefix = "Invalid port reference";
            break;
        case CircuitErrorKind::DuplicateRegistration:
            prefix = "Duplicate registration";
            break;
        case CircuitErrorKind::PortMappingError:
            prefix = "Port mapping failed";
            break;
        case CircuitErrorKind::CyclicTemplate:
            prefix = "Cyclic subcircuit template";
            break;
        case CircuitErrorKind::ParameterMismatch:
            prefix = "Parameter mismatch";
            break;
        }
        std::string msg = "Circuit: " + prefix + ": '" + subject + "'";
        if (!detail.empty()) {
            msg += " (" + detail + ")";
        }
        return msg;
    }

    CircuitErrorKind kind_;
    std::string subject_;
};

// =============================================================================
// Configuration Errors
// =============================================================================

/**
 * @brief Configuration/parsing errors with optional file context
 */
class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg)
        : Error("Config: " + msg, Severity::ERROR, "config") {}

    ConfigError(const std::string &message, const std::string &file, int line = -1,
                const std::string &hint = "")
        : Error(FormatMessage(message, file, line, hint), Severity::ERROR, "config"), file_(file),
          line_(line), hint_(hint) {}

    [[nodiscard]] const std::string &file() const { return file_; }
    [[nodiscard]] int line() const { return line_; }
    [[nodiscard]] const std::string &hint() const { return hint_; }

  private:
    static std::string FormatMessage(const std::string &msg, const std::string &file, int line,
                                     const std::string &hint) {
        std::string result = "Config: " + msg;
        if (!file.empty()) {
            result += "\n  at: " + file;
            if (line >= 0) {
                result += ":" + std::to_string(line);
            }
        }
        if (!hint.empty()) {
            result += "\n  hint: " + hint;
        }
        return result;
    }

    std::string file_;
    int line_ = -1;
    std::string hint_;
};

// =============================================================================
// Wiring Errors
// =============================================================================

/**
 * @brief Patch direction errors (output -> input only)
 */
class WiringError : public Error {
  public:
    explicit WiringError(const std::string &msg)
        : Error("Wiring: " + msg, Severity::ERROR, "wiring") {}

    WiringError(const std::string &source, const std::string &dest, const std::string &reason)
        : Error("Wiring: cannot connect '" + source + "' -> '" + dest + "': " + reason,
                Severity::ERROR, "wiring"),
          source_(source), dest_(dest) {}

    [[nodiscard]] const std::string &source() const { return source_; }
    [[nodiscard]] const std::string &dest() const { return dest_; }

  private:
    std::string source_;
    std::string dest_;
};

// =============================================================================
// I/O Errors
// =============================================================================

/**
 * @brief File and I/O operation errors
 */
class IOError : public Error {
  public:
    explicit IOError(const std::string &msg) : Error("IO: " + msg, Severity::ERROR, "io") {}

    IOError(const std::string &operation, const std::string &path, const std::string &reason)
        : Error("IO: " + operation + " '" + path + "': " + reason, Severity::ERROR, "io"),
          path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

  private:
    std::string path_;
};

} // namespace philbrick

// =============================================================================
// Error Throwing Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

/**
 * @brief Throw an error (simple version, no logging)
 */
#define PHILBRICK_THROW(error) throw(error)

// NOLINTEND(cppcoreguidelines-macro-usage)
