#include "kiln/registry.hpp"

#include <thread>

#include <spdlog/spdlog.h>

namespace kiln {

namespace {

template<typename T, typename Fetch>
Result<T> with_retries(const RetryPolicy& policy, const std::string& what, Fetch fetch) {
    auto delay = policy.base_delay;
    int attempts = policy.attempts < 1 ? 1 : policy.attempts;

    for (int attempt = 1;; ++attempt) {
        Result<T> result = fetch();
        if (result.isOk()) return result;

        const Error& e = result.error();
        bool retryable = e.code() == ErrorCode::REGISTRY_FETCH && e.details().retryable;
        if (!retryable || attempt >= attempts) {
            return result;
        }

        spdlog::debug("fetch {} failed (attempt {}/{}), retrying in {}ms: {}",
                      what, attempt, attempts, delay.count(), e.message());
        std::this_thread::sleep_for(delay);
        delay *= policy.factor;
    }
}

} // namespace

Result<Manifest> RetryingRegistryClient::fetch_manifest(const std::string& name,
                                                        const VersionRange& range) {
    return with_retries<Manifest>(policy_, name + " '" + range.str() + "'",
                                  [&] { return inner_->fetch_manifest(name, range); });
}

Result<Bundle> RetryingRegistryClient::fetch_bundle(const std::string& name, const Version& version) {
    return with_retries<Bundle>(policy_, name + "@" + version.str(),
                                [&] { return inner_->fetch_bundle(name, version); });
}

} // namespace kiln
