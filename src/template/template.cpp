#include "kiln/template.hpp"

#include <algorithm>
#include <cctype>

namespace kiln {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

struct Placeholder {
    size_t begin = 0;  // offset of "{{"
    size_t end = 0;    // one past "}}"
    std::string name;
};

// Find the next well-formed placeholder at or after `from`
bool next_placeholder(const std::string& content, size_t from, Placeholder& out) {
    size_t open = content.find("{{", from);
    while (open != std::string::npos) {
        size_t i = open + 2;
        while (i < content.size() && content[i] == ' ') ++i;

        if (i < content.size() && is_ident_start(content[i])) {
            size_t name_begin = i;
            while (i < content.size() && is_ident_char(content[i])) ++i;
            size_t name_end = i;
            while (i < content.size() && content[i] == ' ') ++i;

            if (content.compare(i, 2, "}}") == 0) {
                out.begin = open;
                out.end = i + 2;
                out.name = content.substr(name_begin, name_end - name_begin);
                return true;
            }
        }
        open = content.find("{{", open + 1);
    }
    return false;
}

} // namespace

std::vector<std::string> find_placeholders(const std::string& content) {
    std::vector<std::string> names;
    Placeholder p;
    size_t pos = 0;
    while (next_placeholder(content, pos, p)) {
        if (std::find(names.begin(), names.end(), p.name) == names.end()) {
            names.push_back(p.name);
        }
        pos = p.end;
    }
    return names;
}

Result<std::string> render_template(const std::string& content, const VariableMap& variables) {
    std::string out;
    out.reserve(content.size());
    std::vector<std::string> missing;

    Placeholder p;
    size_t pos = 0;
    while (next_placeholder(content, pos, p)) {
        out.append(content, pos, p.begin - pos);

        auto it = variables.find(p.name);
        if (it != variables.end()) {
            out += it->second;
        } else if (std::find(missing.begin(), missing.end(), p.name) == missing.end()) {
            missing.push_back(p.name);
        }
        pos = p.end;
    }
    out.append(content, pos, std::string::npos);

    if (!missing.empty()) {
        return Result<std::string>::err(template_error(missing));
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace kiln
