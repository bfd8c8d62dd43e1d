#include "kiln/semver.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace kiln {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, const std::string& delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + delim.length();
    }
    parts.push_back(s.substr(start));
    return parts;
}

// Split string by whitespace into tokens
std::vector<std::string> tokenize(const std::string& s) {
    std::vector<std::string> tokens;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool is_wildcard(const std::string& s) {
    return s == "*" || s == "x" || s == "X";
}

// Full versions go through cpp-semver; numeric overflow surfaces as a
// standard exception rather than semver_exception
std::optional<Version> try_parse(const std::string& s) {
    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

// Decimal component without sign or leading '+'; rejects values that do not
// fit or that leave no room for the exclusive upper bound
std::optional<uint64_t> parse_number(const std::string& s) {
    if (s.empty()) return std::nullopt;
    if (!std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    if (value == std::numeric_limits<uint64_t>::max()) return std::nullopt;
    return value;
}

bool can_bump(uint64_t n) {
    return n < std::numeric_limits<uint64_t>::max();
}

// A version with missing or wildcard trailing parts: "1", "1.2", "1.x", "1.2.*"
struct PartialVersion {
    uint64_t major = 0;
    uint64_t minor = 0;
    uint64_t patch = 0;
    int given = 0;  // number of leading numeric parts
};

std::optional<PartialVersion> parse_partial(const std::string& s) {
    if (is_wildcard(s)) return PartialVersion{};

    auto parts = split(s, ".");
    if (parts.size() > 3) return std::nullopt;

    PartialVersion out;
    uint64_t* fields[] = {&out.major, &out.minor, &out.patch};
    bool wild = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (is_wildcard(parts[i])) {
            wild = true;
            continue;
        }
        if (wild) return std::nullopt;  // "1.x.3"
        auto n = parse_number(parts[i]);
        if (!n) return std::nullopt;
        *fields[i] = *n;
        out.given = static_cast<int>(i) + 1;
    }
    return out;
}

bool is_partial(const std::string& s) {
    auto p = parse_partial(s);
    return p && p->given < 3;
}

// ^1.2.3 -> >=1.2.3 <2.0.0, ^0.2.3 -> >=0.2.3 <0.3.0, ^0.0.3 -> =0.0.3
// ^1 -> >=1.0.0 <2.0.0, ^0.2 -> >=0.2.0 <0.3.0, ^0.0 -> >=0.0.0 <0.1.0
std::optional<ComparatorSet> expand_caret(const std::string& version_str) {
    if (is_partial(version_str)) {
        auto p = *parse_partial(version_str);
        if (p.given == 0) return ComparatorSet{};
        Version lower(p.major, p.minor, 0);
        Version upper = (p.major > 0 || p.given == 1) ? Version(p.major + 1, 0, 0)
                                                       : Version(0, p.minor + 1, 0);
        return ComparatorSet{{Comparator::Ge, lower}, {Comparator::Lt, upper}};
    }

    auto v = try_parse(version_str);
    if (!v) return std::nullopt;
    ComparatorSet set;
    if (v->major() == 0 && v->minor() == 0) {
        set.push_back({Comparator::Eq, *v});
        return set;
    }
    if (!can_bump(v->major()) || !can_bump(v->minor())) return std::nullopt;
    Version upper = v->major() == 0 ? Version(0, v->minor() + 1, 0)
                                    : Version(v->major() + 1, 0, 0);
    set.push_back({Comparator::Ge, *v});
    set.push_back({Comparator::Lt, upper});
    return set;
}

// ~1.2.3 -> >=1.2.3 <1.3.0, ~1.2 -> >=1.2.0 <1.3.0, ~1 -> >=1.0.0 <2.0.0
std::optional<ComparatorSet> expand_tilde(const std::string& version_str) {
    if (is_partial(version_str)) {
        auto p = *parse_partial(version_str);
        if (p.given == 0) return ComparatorSet{};
        Version lower(p.major, p.minor, 0);
        Version upper = p.given == 1 ? Version(p.major + 1, 0, 0)
                                     : Version(p.major, p.minor + 1, 0);
        return ComparatorSet{{Comparator::Ge, lower}, {Comparator::Lt, upper}};
    }

    auto v = try_parse(version_str);
    if (!v) return std::nullopt;
    if (!can_bump(v->minor())) return std::nullopt;
    return ComparatorSet{{Comparator::Ge, *v},
                         {Comparator::Lt, Version(v->major(), v->minor() + 1, 0)}};
}

// *, 1, 1.x, 1.*, 1.2, 1.2.x
std::optional<ComparatorSet> expand_x_range(const std::string& s) {
    auto p = parse_partial(s);
    if (!p || p->given == 3) return std::nullopt;

    if (p->given == 0) return ComparatorSet{};
    if (p->given == 1) {
        return ComparatorSet{{Comparator::Ge, Version(p->major, 0, 0)},
                             {Comparator::Lt, Version(p->major + 1, 0, 0)}};
    }
    return ComparatorSet{{Comparator::Ge, Version(p->major, p->minor, 0)},
                         {Comparator::Lt, Version(p->major, p->minor + 1, 0)}};
}

// Parse a single constraint like ">=1.0.0", "<2.0.0", "==1.0.0", or "1.0.0"
std::optional<Constraint> parse_constraint(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    Comparator op = Comparator::Eq;
    std::string version_str;

    if (s.rfind(">=", 0) == 0) {
        op = Comparator::Ge;
        version_str = s.substr(2);
    } else if (s.rfind("<=", 0) == 0) {
        op = Comparator::Le;
        version_str = s.substr(2);
    } else if (s.rfind("==", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(2);
    } else if (s.rfind(">", 0) == 0) {
        op = Comparator::Gt;
        version_str = s.substr(1);
    } else if (s.rfind("<", 0) == 0) {
        op = Comparator::Lt;
        version_str = s.substr(1);
    } else if (s.rfind("=", 0) == 0) {
        op = Comparator::Eq;
        version_str = s.substr(1);
    } else {
        // No operator means exact match
        op = Comparator::Eq;
        version_str = s;
    }

    version_str = trim(version_str);
    if (version_str.empty()) return std::nullopt;

    auto version = try_parse(version_str);
    if (!version) return std::nullopt;
    return Constraint{op, *version};
}

// Parse a comparator set (space-separated constraints ANDed together)
std::optional<ComparatorSet> parse_comparator_set(const std::string& str) {
    auto tokens = tokenize(str);
    if (tokens.empty()) return std::nullopt;

    ComparatorSet set;
    for (const auto& token : tokens) {
        std::optional<ComparatorSet> expanded;
        if (token[0] == '^') {
            expanded = expand_caret(token.substr(1));
        } else if (token[0] == '~') {
            expanded = expand_tilde(token.substr(1));
        } else if (token.find_first_of("<>=") != 0 && is_partial(token)) {
            expanded = expand_x_range(token);
        } else {
            auto constraint = parse_constraint(token);
            if (constraint) expanded = ComparatorSet{*constraint};
        }
        if (!expanded) return std::nullopt;
        set.insert(set.end(), expanded->begin(), expanded->end());
    }
    return set;
}

struct Bound {
    Version version;
    bool inclusive;
};

void tighten_lower(std::optional<Bound>& lower, const Version& v, bool inclusive) {
    if (!lower || v > lower->version) {
        lower = Bound{v, inclusive};
    } else if (v == lower->version) {
        lower->inclusive = lower->inclusive && inclusive;
    }
}

void tighten_upper(std::optional<Bound>& upper, const Version& v, bool inclusive) {
    if (!upper || v < upper->version) {
        upper = Bound{v, inclusive};
    } else if (v == upper->version) {
        upper->inclusive = upper->inclusive && inclusive;
    }
}

} // namespace

std::optional<Version> VersionRange::min_version() const {
    std::optional<Version> min;

    for (const auto& set : sets) {
        for (const auto& constraint : set) {
            // >=, = and > all define a lower bound
            if (constraint.op == Comparator::Ge || constraint.op == Comparator::Eq ||
                constraint.op == Comparator::Gt) {
                if (!min || constraint.version < *min) {
                    min = constraint.version;
                }
            }
        }
    }

    return min;
}

std::string VersionRange::str() const {
    if (sets.empty()) return "<none>";

    std::string out;
    for (size_t i = 0; i < sets.size(); ++i) {
        if (i > 0) out += " || ";
        if (sets[i].empty()) {
            out += "*";
            continue;
        }
        for (size_t j = 0; j < sets[i].size(); ++j) {
            if (j > 0) out += " ";
            out += to_string(sets[i][j]);
        }
    }
    return out;
}

std::string to_string(const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq: return "=" + constraint.version.str();
        case Comparator::Lt: return "<" + constraint.version.str();
        case Comparator::Le: return "<=" + constraint.version.str();
        case Comparator::Gt: return ">" + constraint.version.str();
        case Comparator::Ge: return ">=" + constraint.version.str();
    }
    return constraint.version.str();
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    return try_parse(s);
}

std::optional<VersionRange> parse_range(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    // Split by || for OR
    auto or_parts = split(s, "||");

    VersionRange range;
    for (const auto& part : or_parts) {
        auto set = parse_comparator_set(trim(part));
        if (!set) return std::nullopt;
        range.sets.push_back(*set);
    }

    if (range.sets.empty()) return std::nullopt;
    return range;
}

bool satisfies(const Version& version, const Constraint& constraint) {
    switch (constraint.op) {
        case Comparator::Eq:
            return version == constraint.version;
        case Comparator::Lt:
            return version < constraint.version;
        case Comparator::Le:
            return version <= constraint.version;
        case Comparator::Gt:
            return version > constraint.version;
        case Comparator::Ge:
            return version >= constraint.version;
    }
    return false;
}

bool satisfies(const Version& version, const ComparatorSet& set) {
    // All constraints in a set must be satisfied (AND)
    for (const auto& constraint : set) {
        if (!satisfies(version, constraint)) {
            return false;
        }
    }
    return true;
}

bool satisfies(const Version& version, const VersionRange& range) {
    // Any set in the range must be satisfied (OR)
    for (const auto& set : range.sets) {
        if (satisfies(version, set)) {
            return true;
        }
    }
    return false;
}

bool is_satisfiable(const ComparatorSet& set) {
    std::optional<Bound> lower;
    std::optional<Bound> upper;

    for (const auto& c : set) {
        switch (c.op) {
            case Comparator::Eq:
                tighten_lower(lower, c.version, true);
                tighten_upper(upper, c.version, true);
                break;
            case Comparator::Ge: tighten_lower(lower, c.version, true); break;
            case Comparator::Gt: tighten_lower(lower, c.version, false); break;
            case Comparator::Le: tighten_upper(upper, c.version, true); break;
            case Comparator::Lt: tighten_upper(upper, c.version, false); break;
        }
    }

    if (!lower || !upper) return true;
    if (lower->version > upper->version) return false;
    if (lower->version == upper->version) {
        return lower->inclusive && upper->inclusive;
    }
    return true;
}

bool is_empty(const VersionRange& range) {
    for (const auto& set : range.sets) {
        if (is_satisfiable(set)) return false;
    }
    return true;
}

VersionRange intersect(const VersionRange& a, const VersionRange& b) {
    VersionRange out;
    for (const auto& left : a.sets) {
        for (const auto& right : b.sets) {
            ComparatorSet combined = left;
            combined.insert(combined.end(), right.begin(), right.end());
            if (is_satisfiable(combined)) {
                out.sets.push_back(std::move(combined));
            }
        }
    }
    return out;
}

std::optional<Version> select_best(const std::vector<Version>& versions,
                                   const VersionRange& range) {
    std::optional<Version> best;

    for (const auto& v : versions) {
        if (satisfies(v, range)) {
            if (!best || v > *best) {
                best = v;
            }
        }
    }

    return best;
}

} // namespace kiln
