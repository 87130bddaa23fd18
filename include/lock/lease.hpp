#pragma once

#include "util/clock.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace pkgrepo {

// Stored at <prefix>/lock. Times are unix milliseconds on the wire.
struct Lease {
    std::string repository_prefix;
    std::string holder_id;
    WallTime acquired_at{};
    WallTime expires_at{};

    bool ExpiredAt(WallTime now) const { return expires_at <= now; }
};

std::string EncodeLease(const Lease& lease);
std::expected<Lease, std::string> DecodeLease(std::string_view text);

} // namespace pkgrepo
