#include "kiln/registry.hpp"
#include "kiln/warnings.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace kiln {

namespace {

bool is_not_found(const Error& e) {
    return e.code() == ErrorCode::REGISTRY_FETCH && !e.details().retryable;
}

std::string served_key(const std::string& name, const Version& version) {
    return name + "@" + version.str();
}

} // namespace

void SourceList::add(RegistrySource source) {
    std::lock_guard<std::mutex> lock(mutex_);
    sources_.push_back(std::move(source));
}

size_t SourceList::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sources_.size();
}

std::vector<RegistrySource> SourceList::ordered_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RegistrySource> ordered;
    for (const auto& s : sources_) {
        if (s.enabled && s.client) ordered.push_back(s);
    }
    // Insertion order breaks priority ties
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RegistrySource& a, const RegistrySource& b) {
                         return a.priority < b.priority;
                     });
    return ordered;
}

void SourceList::report_failure(const RegistrySource& source, const Error& error) {
    if (warnings_) {
        warnings_->emit(Warning::registry_source_failed,
                        warnings::registry_source_failed(source.alias, error.describe()));
    } else {
        spdlog::warn("registry source {} failed: {}", source.alias, error.describe());
    }
}

Result<Manifest> SourceList::fetch_manifest(const std::string& name, const VersionRange& range) {
    bool any_retryable = false;

    for (const auto& source : ordered_sources()) {
        auto manifest = source.client->fetch_manifest(name, range);
        if (manifest.isOk()) {
            std::lock_guard<std::mutex> lock(mutex_);
            served_by_[served_key(name, manifest.value().version)] = source.client;
            return manifest;
        }

        if (is_not_found(manifest.error())) {
            spdlog::debug("{} '{}' not found in source {}", name, range.str(), source.alias);
            continue;
        }
        any_retryable = any_retryable || manifest.error().details().retryable;
        report_failure(source, manifest.error());
    }

    return Result<Manifest>::err(registry_fetch_error(
        name, range.str(), "no enabled registry source has a satisfying version", any_retryable));
}

Result<Bundle> SourceList::fetch_bundle(const std::string& name, const Version& version) {
    std::shared_ptr<RegistryClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = served_by_.find(served_key(name, version));
        if (it != served_by_.end()) client = it->second;
    }
    if (client) {
        return client->fetch_bundle(name, version);
    }

    for (const auto& source : ordered_sources()) {
        auto bundle = source.client->fetch_bundle(name, version);
        if (bundle.isOk() || !is_not_found(bundle.error())) {
            return bundle;
        }
    }
    return Result<Bundle>::err(
        registry_fetch_error(name, version.str(), "no enabled registry source has this version"));
}

} // namespace kiln
