#include "kiln/platform.hpp"

#include <cctype>
#include <filesystem>

namespace kiln {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool has_drive_prefix(const std::string& s) {
    return s.size() >= 2 && s[1] == ':' && std::isalpha(static_cast<unsigned char>(s[0]));
}

} // namespace

PathValidation validate_relative_path(const std::string& path) {
    PathValidation result;

    if (path.empty()) {
        result.error = "path is empty";
        return result;
    }

    if (contains_nul(path)) {
        result.error = "path contains NUL: " + path;
        return result;
    }

    std::string portable = to_portable_path(path);

    // Reject absolute paths
    if (portable[0] == '/' || has_drive_prefix(portable)) {
        result.error = "absolute path not allowed: " + path;
        return result;
    }

    fs::path normalized;
    for (const auto& component : fs::path(portable)) {
        std::string comp = component.string();
        if (comp == "..") {
            result.error = "path traversal not allowed: " + path;
            return result;
        }
        if (comp != "." && !comp.empty()) {
            normalized /= comp;
        }
    }

    if (normalized.empty()) {
        result.error = "path names no file: " + path;
        return result;
    }

    result.safe = true;
    result.normalized_path = to_portable_path(normalized.string());
    return result;
}

bool paths_overlap(const std::string& a, const std::string& b) {
    if (a == b) return true;
    const std::string& shorter = a.size() < b.size() ? a : b;
    const std::string& longer = a.size() < b.size() ? b : a;
    return longer.compare(0, shorter.size(), shorter) == 0 && longer[shorter.size()] == '/';
}

} // namespace kiln
