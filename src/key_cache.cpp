#include "authorizer/key_cache.hpp"
#include "authorizer/errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace authorizer {

KeyCache::KeyCache(std::string url,
                   std::chrono::seconds minRefreshInterval,
                   std::shared_ptr<KeySetFetcher> fetcher,
                   std::shared_ptr<const Clock> clock)
    : url_(std::move(url)),
      minRefreshInterval_(minRefreshInterval),
      fetcher_(std::move(fetcher)),
      clock_(std::move(clock)) {
    if (!fetcher_ || !clock_) {
        throw std::invalid_argument("KeyCache requires a fetcher and a clock");
    }
}

std::pair<std::shared_ptr<const KeyRecord>, std::uint64_t> KeyCache::find(const std::string& kid) const {
    std::shared_lock lock(stateMutex_);
    auto it = keys_.find(kid);
    return {it == keys_.end() ? nullptr : it->second, refreshGeneration_};
}

std::shared_ptr<const KeyRecord> KeyCache::lookup(const std::string& kid) {
    auto [key, observed] = find(kid);
    if (key) {
        return key;
    }

    std::lock_guard refresh_lock(refreshMutex_);

    {
        std::shared_lock lock(stateMutex_);

        // Another lookup refreshed while we waited: share its outcome
        if (refreshGeneration_ != observed) {
            if (auto it = keys_.find(kid); it != keys_.end()) {
                return it->second;
            }
            if (lastRefreshFailed_) {
                throw AuthorizerError(DenyReason::UpstreamFetchFailed,
                                      "Key set refresh failed while looking up key '" + kid + "'");
            }
            throw AuthorizerError(DenyReason::KeyNotFound, "Key '" + kid + "' not found");
        }

        if (lastRefresh_ && clock_->monotonicNow() - *lastRefresh_ < minRefreshInterval_) {
            spdlog::debug("Key '{}' not cached and refresh is rate limited", kid);
            throw AuthorizerError(DenyReason::KeyNotFound, "Key '" + kid + "' not found");
        }
    }

    refresh();

    if (auto refreshed = find(kid).first) {
        return refreshed;
    }
    throw AuthorizerError(DenyReason::KeyNotFound, "Key '" + kid + "' not found after refresh");
}

void KeyCache::refresh() {
    spdlog::debug("Refreshing key set from '{}'", url_);

    KeysMap fresh;
    try {
        fresh = parseKeySet(fetcher_->fetch(url_));
    } catch (const std::exception& e) {
        {
            std::unique_lock lock(stateMutex_);
            ++refreshGeneration_;
            lastRefreshFailed_ = true;
        }
        spdlog::warn("Failed to refresh key set from '{}': {}", url_, e.what());
        throw AuthorizerError(DenyReason::UpstreamFetchFailed, e.what());
    }

    std::size_t count = fresh.size();
    {
        std::unique_lock lock(stateMutex_);
        keys_.swap(fresh);
        lastRefresh_ = clock_->monotonicNow();
        ++refreshGeneration_;
        lastRefreshFailed_ = false;
    }
    spdlog::debug("Key set refreshed with {} keys", count);
}

std::size_t KeyCache::size() const {
    std::shared_lock lock(stateMutex_);
    return keys_.size();
}

std::optional<std::chrono::steady_clock::time_point> KeyCache::lastRefresh() const {
    std::shared_lock lock(stateMutex_);
    return lastRefresh_;
}

}
