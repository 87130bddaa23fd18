#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pkgrepo {

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

// Wall time and sleeping behind an interface so leases and backoff can be driven by tests.
class IClock {
public:
    virtual ~IClock() = default;
    virtual WallTime Now() const = 0;
    virtual void SleepFor(std::chrono::milliseconds d) const = 0;
};

std::shared_ptr<const IClock> SystemClock();

std::int64_t ToUnixMillis(WallTime t);
WallTime FromUnixMillis(std::int64_t ms);
std::string FormatIso8601(WallTime t);

} // namespace pkgrepo
