#include "kiln/digest.hpp"
#include "kiln/installer.hpp"
#include "kiln/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace kiln {

const char* file_state_to_string(FileState state) {
    switch (state) {
        case FileState::Ok: return "ok";
        case FileState::Modified: return "modified";
        case FileState::Missing: return "missing";
        default: return "unknown";
    }
}

bool VerifyReport::clean() const {
    return std::all_of(files.begin(), files.end(),
                       [](const VerifiedFile& f) { return f.state == FileState::Ok; });
}

Result<VerifyReport> verify_installation(const std::string& target_root, WarningCollector* warnings) {
    Ledger ledger(ledger_path(target_root));
    auto loaded = ledger.load(warnings);
    if (loaded.isErr()) {
        return Result<VerifyReport>::err(loaded.error());
    }

    VerifyReport report;
    for (const auto& record : ledger.latest_per_component()) {
        for (const auto& file : record.files) {
            VerifiedFile vf;
            vf.component = record.name;
            vf.version = record.version;
            vf.path = file.path;

            std::string full = join_path(target_root, file.path);
            if (!is_regular_file(full)) {
                vf.state = FileState::Missing;
            } else {
                auto hash = compute_file_sha256(full);
                if (!hash.ok) {
                    return Result<VerifyReport>::err(io_error(full, hash.error));
                }
                vf.state = format_checksum(hash.hex_digest) == file.checksum ? FileState::Ok
                                                                             : FileState::Modified;
            }

            if (vf.state != FileState::Ok) {
                spdlog::debug("{}@{}: {} is {}", vf.component, vf.version, vf.path,
                              file_state_to_string(vf.state));
            }
            report.files.push_back(std::move(vf));
        }
    }
    return Result<VerifyReport>::ok(std::move(report));
}

} // namespace kiln
