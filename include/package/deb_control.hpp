#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace pkgrepo {

struct DebControl {
    // Field names as written in the control file ("Package", "Version", ...).
    std::map<std::string, std::string> fields;

    std::string Get(const std::string& field) const;
};

bool HasDebMagic(std::span<const std::uint8_t> bytes);

// Parses RFC 822 style "Field: value" stanzas; continuation lines are folded.
DebControl ParseDebControlText(std::string_view text);

// Locates control.tar.* in the ar container and reads its ./control member.
Result ReadDebControl(std::span<const std::uint8_t> bytes, DebControl& out);

} // namespace pkgrepo
