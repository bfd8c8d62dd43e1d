#include "kiln/registry.hpp"

#include <spdlog/spdlog.h>

namespace kiln {

CachingRegistryClient::CachingRegistryClient(std::shared_ptr<RegistryClient> inner, size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity == 0 ? 1 : capacity) {}

Result<Manifest> CachingRegistryClient::fetch_manifest(const std::string& name,
                                                       const VersionRange& range) {
    std::string key = name + "|" + range.str();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_key_.find(key);
        if (it != by_key_.end()) {
            ++hits_;
            lru_.splice(lru_.begin(), lru_, it->second);
            return Result<Manifest>::ok(it->second->manifest);
        }
        ++misses_;
    }

    // Fetch outside the lock; concurrent misses on one key both go upstream
    auto manifest = inner_->fetch_manifest(name, range);
    if (manifest.isErr()) {
        return manifest;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (by_key_.count(key) == 0) {
        lru_.push_front({key, name, manifest.value()});
        by_key_[key] = lru_.begin();
        while (lru_.size() > capacity_) {
            by_key_.erase(lru_.back().key);
            lru_.pop_back();
        }
    }
    return manifest;
}

Result<Bundle> CachingRegistryClient::fetch_bundle(const std::string& name, const Version& version) {
    return inner_->fetch_bundle(name, version);
}

void CachingRegistryClient::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    lru_.clear();
    by_key_.clear();
    spdlog::debug("registry cache cleared");
}

void CachingRegistryClient::invalidate(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = lru_.begin(); it != lru_.end();) {
        if (it->name == name) {
            by_key_.erase(it->key);
            it = lru_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CachingRegistryClient::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

size_t CachingRegistryClient::misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
}

size_t CachingRegistryClient::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lru_.size();
}

} // namespace kiln
