#include "kiln/warnings.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

namespace kiln {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Stable "k=v k=v" rendering for log lines
std::string format_fields(const std::unordered_map<std::string, std::string>& fields) {
    std::map<std::string, std::string> sorted(fields.begin(), fields.end());
    std::string out;
    for (const auto& [k, v] : sorted) {
        if (!out.empty()) out += " ";
        out += k + "=" + v;
    }
    return out;
}

} // namespace

void WarningCollector::set_policy(const std::unordered_map<std::string, WarningAction>& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    policy_.clear();
    for (const auto& [key, action] : policy) {
        policy_[to_lower(key)] = action;
    }
}

void WarningCollector::emit(Warning warning, const std::unordered_map<std::string, std::string>& fields) {
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit_with_context(Warning warning, const std::string& context) {
    std::unordered_map<std::string, std::string> fields;
    if (!context.empty()) {
        fields["context"] = context;
    }
    emit(warning_to_string(warning), fields);
}

void WarningCollector::emit(const std::string& warning_key,
                            std::unordered_map<std::string, std::string> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    WarningAction action = get_effective_action(warning_key);

    if (action == WarningAction::Error) {
        spdlog::error("{}: {}", warning_key, format_fields(fields));
    } else if (action == WarningAction::Warn) {
        spdlog::warn("{}: {}", warning_key, format_fields(fields));
    }

    // Ignored warnings are still collected but marked
    warnings_.push_back({warning_key, std::move(fields), action});
}

std::vector<WarningObject> WarningCollector::get_warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WarningObject> result;

    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Ignore) {
            continue;
        }

        WarningObject obj;
        obj.key = w.key;
        obj.action = action_to_string(w.effective_action);
        obj.fields = w.fields;
        result.push_back(std::move(obj));
    }

    return result;
}

bool WarningCollector::has_errors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : warnings_) {
        if (w.effective_action == WarningAction::Error) {
            return true;
        }
    }
    return false;
}

void WarningCollector::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.clear();
}

WarningAction WarningCollector::get_effective_action(const std::string& key) const {
    auto policy_it = policy_.find(to_lower(key));
    if (policy_it != policy_.end()) {
        return policy_it->second;
    }

    // Default: warn
    return WarningAction::Warn;
}

} // namespace kiln
