#include "kiln/error.hpp"

#include <sstream>

namespace kiln {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::MANIFEST_INVALID: return "ManifestError";
        case ErrorCode::CONSTRAINT_PARSE: return "ConstraintParseError";
        case ErrorCode::CYCLE: return "CycleError";
        case ErrorCode::CONFLICT: return "ConflictError";
        case ErrorCode::REGISTRY_FETCH: return "RegistryFetchError";
        case ErrorCode::TEMPLATE: return "TemplateError";
        case ErrorCode::FILE_CONFLICT: return "FileConflictError";
        case ErrorCode::IO_ERROR: return "IOError";
        case ErrorCode::SKIPPED_DEPENDENCY_FAILED: return "SkippedDueToDependencyFailure";
        case ErrorCode::CANCELLED: return "Cancelled";
        default: return "UnknownError";
    }
}

std::string Error::toString() const {
    return std::string(error_code_to_string(code_)) + ": " + message_;
}

std::string Error::describe() const {
    std::string out = toString();
    for (const auto& ctx : context_) {
        out += "; caused by " + ctx;
    }
    return out;
}

Error manifest_error(const std::string& field, const std::string& message) {
    ErrorDetails d;
    d.field = field;
    std::string msg = field.empty() ? message : field + ": " + message;
    return Error(ErrorCode::MANIFEST_INVALID, msg, std::move(d));
}

Error constraint_parse_error(const std::string& constraint, const std::string& context) {
    ErrorDetails d;
    d.constraints = {constraint};
    std::string msg = "cannot parse version constraint '" + constraint + "'";
    if (!context.empty()) msg += " (" + context + ")";
    return Error(ErrorCode::CONSTRAINT_PARSE, msg, std::move(d));
}

Error cycle_error(const std::vector<std::string>& cycle) {
    ErrorDetails d;
    d.cycle = cycle;
    return Error(ErrorCode::CYCLE, "dependency cycle " + join(cycle, " -> "), std::move(d));
}

Error conflict_error(const std::string& name,
                     const std::vector<std::string>& requesters,
                     const std::vector<std::string>& constraints) {
    ErrorDetails d;
    d.name = name;
    d.requesters = requesters;
    d.constraints = constraints;

    std::ostringstream msg;
    msg << "no version of " << name << " satisfies all requesters:";
    for (size_t i = 0; i < requesters.size(); ++i) {
        msg << (i == 0 ? " " : ", ") << requesters[i] << " requires '"
            << (i < constraints.size() ? constraints[i] : std::string("*")) << "'";
    }
    return Error(ErrorCode::CONFLICT, msg.str(), std::move(d));
}

Error registry_fetch_error(const std::string& name, const std::string& constraint,
                           const std::string& reason, bool retryable) {
    ErrorDetails d;
    d.name = name;
    d.constraints = {constraint};
    d.retryable = retryable;
    return Error(ErrorCode::REGISTRY_FETCH,
                 "cannot fetch " + name + " '" + constraint + "': " + reason, std::move(d));
}

Error template_error(const std::vector<std::string>& missing,
                     const std::vector<std::string>& undeclared) {
    ErrorDetails d;
    d.missing = missing;
    d.undeclared = undeclared;

    std::string msg;
    if (!missing.empty()) {
        msg = "missing variables [" + join(missing, ", ") + "]";
    }
    if (!undeclared.empty()) {
        if (!msg.empty()) msg += ", ";
        msg += "undeclared variables [" + join(undeclared, ", ") + "]";
    }
    return Error(ErrorCode::TEMPLATE, msg, std::move(d));
}

Error file_conflict_error(const std::vector<std::string>& paths) {
    ErrorDetails d;
    d.paths = paths;
    return Error(ErrorCode::FILE_CONFLICT, "at path " + join(paths, ", "), std::move(d));
}

Error io_error(const std::string& path, const std::string& reason) {
    ErrorDetails d;
    d.paths = {path};
    return Error(ErrorCode::IO_ERROR, path + ": " + reason, std::move(d));
}

} // namespace kiln
