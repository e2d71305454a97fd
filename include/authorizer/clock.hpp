#pragma once
#include <chrono>
#include <cstdint>

namespace authorizer {

/// Time source for the key cache (monotonic) and token timing checks (wall clock)
class Clock {
public:
    virtual ~Clock() = default;

    /// Monotonic time used for refresh rate limiting
    [[nodiscard]] virtual std::chrono::steady_clock::time_point monotonicNow() const = 0;

    /// Current Unix time in seconds
    [[nodiscard]] virtual std::int64_t unixNow() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] std::chrono::steady_clock::time_point monotonicNow() const override;
    [[nodiscard]] std::int64_t unixNow() const override;
};

} // namespace authorizer
