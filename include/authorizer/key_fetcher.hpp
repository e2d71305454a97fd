#pragma once
#include <chrono>
#include <stdexcept>
#include <string>

namespace authorizer {

/// Transport failure, non-2xx status or oversized body while fetching a key set
class FetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Retrieves the raw key set document
class KeySetFetcher {
public:
    virtual ~KeySetFetcher() = default;

    /// @throws FetchError on any failure
    [[nodiscard]] virtual std::string fetch(const std::string& url) = 0;
};

/// HTTP(S) GET with libcurl
class CurlKeySetFetcher : public KeySetFetcher {
public:
    explicit CurlKeySetFetcher(std::chrono::seconds timeout);

    [[nodiscard]] std::string fetch(const std::string& url) override;

private:
    std::chrono::seconds timeout_;
};

} // namespace authorizer
