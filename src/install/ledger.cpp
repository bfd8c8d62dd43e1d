#include "kiln/ledger.hpp"
#include "kiln/platform.hpp"
#include "kiln/warnings.hpp"

#include <algorithm>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

std::string serialize_install_record(const InstallRecord& record) {
    nlohmann::ordered_json files = nlohmann::ordered_json::array();
    for (const auto& f : record.files) {
        files.push_back({{"path", f.path}, {"checksum", f.checksum}});
    }

    nlohmann::ordered_json j;
    j["name"] = record.name;
    j["version"] = record.version;
    j["files"] = files;
    j["installedAt"] = record.installed_at;
    j["requestedDirectly"] = record.requested_directly;
    return j.dump();
}

InstallRecordParseResult parse_install_record(const std::string& line) {
    InstallRecordParseResult result;

    try {
        auto j = nlohmann::json::parse(line);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        auto name = get_string(j, "name");
        if (!name || name->empty()) {
            result.error = "name missing";
            return result;
        }
        result.record.name = *name;

        auto version = get_string(j, "version");
        if (!version || version->empty()) {
            result.error = "version missing";
            return result;
        }
        result.record.version = *version;

        if (!j.contains("files") || !j["files"].is_array()) {
            result.error = "files missing";
            return result;
        }
        for (const auto& f : j["files"]) {
            auto path = get_string(f, "path");
            auto checksum = get_string(f, "checksum");
            if (!path || !checksum) {
                result.error = "files entry needs path and checksum";
                return result;
            }
            result.record.files.push_back({*path, *checksum});
        }

        result.record.installed_at = get_string(j, "installedAt").value_or("");
        if (j.contains("requestedDirectly") && j["requestedDirectly"].is_boolean()) {
            result.record.requested_directly = j["requestedDirectly"].get<bool>();
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string ledger_path(const std::string& target_root) {
    return join_path(join_path(target_root, ".component-lock"), "ledger.jsonl");
}

Result<void> Ledger::load(WarningCollector* warnings) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!path_exists(path_)) {
        loaded_count_ = entries_.size();
        return Result<void>::ok();
    }

    auto content = read_file(path_);
    if (!content) {
        return Result<void>::err(io_error(path_, "cannot read ledger"));
    }

    std::istringstream in(*content);
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto parsed = parse_install_record(line);
        if (!parsed.ok) {
            if (warnings) {
                warnings->emit(Warning::invalid_ledger_entry,
                               warnings::invalid_ledger_entry(path_, line_no, parsed.error));
            } else {
                spdlog::warn("{}:{}: invalid ledger entry: {}", path_, line_no, parsed.error);
            }
            continue;
        }
        entries_.push_back(std::move(parsed.record));
    }

    loaded_count_ = entries_.size();
    spdlog::debug("ledger {}: {} entries", path_, loaded_count_);
    return Result<void>::ok();
}

Result<void> Ledger::append(const InstallRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string dir = get_parent_directory(path_);
    if (!dir.empty() && !create_directories(dir)) {
        return Result<void>::err(io_error(dir, "cannot create ledger directory"));
    }

    auto written = append_line_durable(path_, serialize_install_record(record));
    if (!written.ok) {
        return Result<void>::err(io_error(path_, written.error));
    }

    entries_.push_back(record);
    return Result<void>::ok();
}

std::vector<InstallRecord> Ledger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::vector<InstallRecord> Ledger::latest_per_component() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<InstallRecord> latest;
    for (const auto& e : entries_) {
        auto it = std::find_if(latest.begin(), latest.end(),
                               [&](const InstallRecord& r) { return r.name == e.name; });
        if (it == latest.end()) {
            latest.push_back(e);
        } else {
            *it = e;
        }
    }
    return latest;
}

bool Ledger::recorded_this_run(const std::string& name, const std::string& version,
                               const std::string& path, const std::string& checksum) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = loaded_count_; i < entries_.size(); ++i) {
        const auto& e = entries_[i];
        if (e.name != name || e.version != version) continue;
        for (const auto& f : e.files) {
            if (f.path == path && f.checksum == checksum) return true;
        }
    }
    return false;
}

std::optional<std::string> Ledger::owner_of(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        for (const auto& f : it->files) {
            if (f.path == path) return it->name + "@" + it->version;
        }
    }
    return std::nullopt;
}

} // namespace kiln
