#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace pkgrepo {

namespace rpmtag {
inline constexpr std::uint32_t kName = 1000;
inline constexpr std::uint32_t kVersion = 1001;
inline constexpr std::uint32_t kRelease = 1002;
inline constexpr std::uint32_t kEpoch = 1003;
inline constexpr std::uint32_t kOs = 1021;
inline constexpr std::uint32_t kArch = 1022;
inline constexpr std::uint32_t kSourceRpm = 1044;
} // namespace rpmtag

struct RpmHeaderInfo {
    std::string name;
    std::string epoch;
    std::string version;
    std::string release;
    std::string arch;
    std::string os;
    // SOURCERPM is absent from source packages.
    bool source_package = false;
};

bool HasRpmLeadMagic(std::span<const std::uint8_t> bytes);

// Reads the identity tags of the main header. Only the lead, the signature
// header and the main header index are inspected; the payload is not touched.
Result ReadRpmHeader(std::span<const std::uint8_t> bytes, RpmHeaderInfo& out);

} // namespace pkgrepo
