#pragma once

/**
 * @file registry.hpp
 * @brief Sources of manifests and bundles
 *
 * The resolver and installer only see the abstract RegistryClient. Concrete
 * clients compose: a SourceList of DirectoryRegistry instances, wrapped in a
 * RetryingRegistryClient, wrapped in a CachingRegistryClient.
 *
 * @example
 * ```cpp
 * auto dir = std::make_shared<kiln::DirectoryRegistry>("/srv/registry");
 * auto retrying = std::make_shared<kiln::RetryingRegistryClient>(dir);
 * kiln::CachingRegistryClient client(retrying);
 * auto manifest = client.fetch_manifest("web_search", *kiln::parse_range("^1.0.0"));
 * ```
 */

#include "kiln/error.hpp"
#include "kiln/manifest.hpp"
#include "kiln/semver.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

class WarningCollector;

/// Raw file contents of one component version: bundle-relative path -> bytes
using Bundle = std::map<std::string, std::string>;

// ============================================================================
// RegistryClient
// ============================================================================

/**
 * @brief Supplies manifests and bundles by name and version
 *
 * Implementations must be safe to call from several threads at once.
 * A name with no satisfying version fails with a non-retryable
 * RegistryFetchError; transient failures set ErrorDetails::retryable.
 */
class RegistryClient {
public:
    virtual ~RegistryClient() = default;

    /// Highest version of `name` satisfying `range`
    virtual Result<Manifest> fetch_manifest(const std::string& name, const VersionRange& range) = 0;

    /// Files referenced by the manifest's files[].src, keyed by src
    virtual Result<Bundle> fetch_bundle(const std::string& name, const Version& version) = 0;
};

// ============================================================================
// DirectoryRegistry
// ============================================================================

struct RegistryIndexEntry {
    std::string name;
    std::string version;
    std::string type;
    std::string description;
    std::string manifest_path;  // relative to the registry root
};

/**
 * @brief Registry laid out on a local filesystem
 *
 * Reads `<root>/index.json` on first use. Without an index the root is
 * scanned for `component.json` files. Bundle `src` paths are relative to
 * the directory holding the manifest.
 */
class DirectoryRegistry : public RegistryClient {
public:
    explicit DirectoryRegistry(std::string root);

    Result<Manifest> fetch_manifest(const std::string& name, const VersionRange& range) override;
    Result<Bundle> fetch_bundle(const std::string& name, const Version& version) override;

    /// Index entries in index order (loads the index if needed)
    Result<std::vector<RegistryIndexEntry>> entries();

    const std::string& root() const { return root_; }

private:
    struct Indexed {
        RegistryIndexEntry entry;
        Version version;
    };

    Result<void> ensure_loaded();
    Result<Manifest> read_manifest(const RegistryIndexEntry& entry) const;
    const Indexed* find(const std::string& name, const Version& version) const;

    std::string root_;
    std::mutex mutex_;
    bool loaded_ = false;
    std::vector<Indexed> index_;
};

struct IndexBuildResult {
    std::string index_path;
    std::vector<RegistryIndexEntry> entries;
};

/**
 * @brief Scan a registry root and write `<root>/index.json` atomically
 *
 * Every `component.json` is validated with load_manifest(). Any invalid
 * manifest or duplicate name@version aborts the build; the error's
 * details.paths lists every failing manifest.
 */
Result<IndexBuildResult> build_registry_index(const std::string& root);

/// Parse an index.json document
Result<std::vector<RegistryIndexEntry>> parse_registry_index(const std::string& json_str);

/// Entries whose name or description contains `term` (case-insensitive),
/// optionally restricted to one component type; order is preserved
std::vector<RegistryIndexEntry> filter_registry_entries(const std::vector<RegistryIndexEntry>& entries,
                                                        const std::string& term,
                                                        const std::string& type = "");

// ============================================================================
// SourceList
// ============================================================================

struct RegistrySource {
    std::string alias;
    int priority = 100;  // lower wins
    bool enabled = true;
    std::shared_ptr<RegistryClient> client;
};

/**
 * @brief Consults several sources in priority order
 *
 * A manifest is served by the first enabled source that has a satisfying
 * version; its bundle is then fetched from the same source. Failures other
 * than "not found" emit registry_source_failed and the search continues.
 */
class SourceList : public RegistryClient {
public:
    explicit SourceList(WarningCollector* warnings = nullptr) : warnings_(warnings) {}

    void add(RegistrySource source);

    Result<Manifest> fetch_manifest(const std::string& name, const VersionRange& range) override;
    Result<Bundle> fetch_bundle(const std::string& name, const Version& version) override;

    size_t size() const;

private:
    std::vector<RegistrySource> ordered_sources() const;
    void report_failure(const RegistrySource& source, const Error& error);

    WarningCollector* warnings_;
    mutable std::mutex mutex_;
    std::vector<RegistrySource> sources_;
    std::unordered_map<std::string, std::shared_ptr<RegistryClient>> served_by_;
};

// ============================================================================
// CachingRegistryClient
// ============================================================================

/**
 * @brief Bounded LRU cache of manifest responses
 *
 * Keyed by (name, canonical range). Only successful lookups are cached.
 * Bundles pass straight through.
 */
class CachingRegistryClient : public RegistryClient {
public:
    explicit CachingRegistryClient(std::shared_ptr<RegistryClient> inner, size_t capacity = 256);

    Result<Manifest> fetch_manifest(const std::string& name, const VersionRange& range) override;
    Result<Bundle> fetch_bundle(const std::string& name, const Version& version) override;

    void invalidate();
    void invalidate(const std::string& name);

    size_t hits() const;
    size_t misses() const;
    size_t size() const;

private:
    struct Entry {
        std::string key;
        std::string name;
        Manifest manifest;
    };

    std::shared_ptr<RegistryClient> inner_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> lru_;  // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> by_key_;
    size_t hits_ = 0;
    size_t misses_ = 0;
};

// ============================================================================
// RetryingRegistryClient
// ============================================================================

struct RetryPolicy {
    int attempts = 3;
    std::chrono::milliseconds base_delay{200};
    int factor = 2;
};

/// Retries retryable RegistryFetchErrors with exponential backoff
class RetryingRegistryClient : public RegistryClient {
public:
    explicit RetryingRegistryClient(std::shared_ptr<RegistryClient> inner, RetryPolicy policy = {})
        : inner_(std::move(inner)), policy_(policy) {}

    Result<Manifest> fetch_manifest(const std::string& name, const VersionRange& range) override;
    Result<Bundle> fetch_bundle(const std::string& name, const Version& version) override;

private:
    std::shared_ptr<RegistryClient> inner_;
    RetryPolicy policy_;
};

} // namespace kiln
