#pragma once
#include "authorizer/clock.hpp"
#include "authorizer/key_fetcher.hpp"
#include "authorizer/key_set.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace authorizer {

/**
 * Concurrent cache of the verification keys published at a key set URL.
 *
 * Hits only take a shared lock. A miss refreshes the whole key set, at most
 * once per minimum interval, and at most one refresh runs at a time: misses
 * arriving during a refresh wait for it and share its outcome. There is no
 * TTL; keys stay until a refresh replaces the set.
 */
class KeyCache {
public:
    KeyCache(std::string url,
             std::chrono::seconds minRefreshInterval,
             std::shared_ptr<KeySetFetcher> fetcher,
             std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;

    /**
     * Find the key for a key id, refreshing the key set on a miss when allowed
     * @throws AuthorizerError(KeyNotFound) if the key is unknown after any refresh
     * @throws AuthorizerError(UpstreamFetchFailed) if the refresh failed
     */
    [[nodiscard]] std::shared_ptr<const KeyRecord> lookup(const std::string& kid);

    /// Number of keys currently indexed
    [[nodiscard]] std::size_t size() const;

    /// Monotonic time of the last successful refresh (empty if none yet)
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> lastRefresh() const;

    [[nodiscard]] const std::string& url() const { return url_; }

private:
    // Key (may be null) and the refresh generation it was read under
    std::pair<std::shared_ptr<const KeyRecord>, std::uint64_t> find(const std::string& kid) const;

    void refresh();

    const std::string url_;
    const std::chrono::seconds minRefreshInterval_;
    const std::shared_ptr<KeySetFetcher> fetcher_;
    const std::shared_ptr<const Clock> clock_;

    // Guards the fields below; held exclusively only to swap in a new state
    mutable std::shared_mutex stateMutex_;
    KeysMap keys_;
    std::optional<std::chrono::steady_clock::time_point> lastRefresh_;
    std::uint64_t refreshGeneration_ = 0;  // incremented by every refresh attempt
    bool lastRefreshFailed_ = false;

    // Single-flight refresh
    std::mutex refreshMutex_;
};

} // namespace authorizer
