#pragma once

/**
 * @file error.hpp
 * @brief Error and Result types shared by every kiln component
 *
 * Every fallible operation in the resolution and install pipeline returns
 * a Result<T>. The Error it carries names its category (ErrorCode), a human
 * message, an optional context chain, and the typed details a caller needs
 * to act on the failure without re-running (the missing variables, the
 * conflicting requesters, the cycle path, ...).
 *
 * @example
 * ```cpp
 * auto plan = resolver.resolve({{"B", "*"}});
 * if (plan.isErr()) {
 *     std::cerr << plan.error().describe() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kiln {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    // Resolution (abort the whole run, nothing written)
    MANIFEST_INVALID,
    CONSTRAINT_PARSE,
    CYCLE,
    CONFLICT,
    REGISTRY_FETCH,

    // Installation (scoped to one component)
    TEMPLATE,
    FILE_CONFLICT,
    IO_ERROR,
    SKIPPED_DEPENDENCY_FAILED,
    CANCELLED,
};

/// Taxonomy name used in user-visible messages (e.g. "FileConflictError")
const char* error_code_to_string(ErrorCode code);

/**
 * @brief Typed payload attached to an Error
 *
 * Only the members relevant to the error's code are populated.
 */
struct ErrorDetails {
    std::string field;                     ///< ManifestError: offending field
    std::string name;                      ///< component the error is about
    std::vector<std::string> requesters;   ///< ConflictError: who asked
    std::vector<std::string> constraints;  ///< ConflictError: what they asked for
    std::vector<std::string> cycle;        ///< CycleError: A, B, ..., A
    std::vector<std::string> missing;      ///< TemplateError: unsupplied variables
    std::vector<std::string> undeclared;   ///< TemplateError: used but not declared
    std::vector<std::string> paths;        ///< FileConflictError / IOError paths
    bool retryable = false;                ///< RegistryFetchError: transient failure
};

/**
 * @brief Error type with code, message, details and causal context
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, ErrorDetails details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    /// Append a cause to the chain ("B required by A")
    Error& withContext(const std::string& context) {
        context_.push_back(context);
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const ErrorDetails& details() const { return details_; }
    const std::vector<std::string>& context() const { return context_; }

    /// "<Taxonomy>: <message>"
    std::string toString() const;

    /// Full causal chain: "<Taxonomy>: <message>; caused by <ctx>; caused by <ctx>"
    std::string describe() const;

private:
    ErrorCode code_;
    std::string message_;
    ErrorDetails details_;
    std::vector<std::string> context_;
};

// ============================================================================
// Error Constructors
// ============================================================================

Error manifest_error(const std::string& field, const std::string& message);
Error constraint_parse_error(const std::string& constraint, const std::string& context);
Error cycle_error(const std::vector<std::string>& cycle);
Error conflict_error(const std::string& name,
                     const std::vector<std::string>& requesters,
                     const std::vector<std::string>& constraints);
Error registry_fetch_error(const std::string& name, const std::string& constraint,
                           const std::string& reason, bool retryable = false);
Error template_error(const std::vector<std::string>& missing,
                     const std::vector<std::string>& undeclared = {});
Error file_conflict_error(const std::vector<std::string>& paths);
Error io_error(const std::string& path, const std::string& reason);

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace kiln
