#include "util/clock.hpp"

#include <ctime>
#include <thread>

namespace pkgrepo {

namespace {

class RealClock final : public IClock {
public:
    WallTime Now() const override { return WallClock::now(); }
    void SleepFor(std::chrono::milliseconds d) const override {
        if (d.count() > 0) std::this_thread::sleep_for(d);
    }
};

} // namespace

std::shared_ptr<const IClock> SystemClock() {
    static const std::shared_ptr<const IClock> kClock = std::make_shared<RealClock>();
    return kClock;
}

std::int64_t ToUnixMillis(WallTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

WallTime FromUnixMillis(std::int64_t ms) {
    return WallTime(std::chrono::duration_cast<WallClock::duration>(std::chrono::milliseconds(ms)));
}

std::string FormatIso8601(WallTime t) {
    const std::time_t secs = WallClock::to_time_t(t);
    std::tm tm{};
    if (gmtime_r(&secs, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace pkgrepo
