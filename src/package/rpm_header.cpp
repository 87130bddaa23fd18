#include "package/rpm_header.hpp"

#include <cstring>

namespace pkgrepo {

namespace {

constexpr size_t kLeadSize = 96;
constexpr std::uint8_t kLeadMagic[4] = {0xED, 0xAB, 0xEE, 0xDB};
constexpr std::uint8_t kHeaderMagic[3] = {0x8E, 0xAD, 0xE8};
constexpr size_t kHeaderIntroSize = 16;
constexpr size_t kIndexEntrySize = 16;
constexpr std::uint32_t kMaxIndexEntries = 0x10000;
constexpr std::uint32_t kMaxDataSize = 256u * 1024u * 1024u;

constexpr std::uint32_t kTypeInt32 = 4;
constexpr std::uint32_t kTypeString = 6;
constexpr std::uint32_t kTypeI18nString = 9;

std::uint32_t ReadBe32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

struct HeaderView {
    const std::uint8_t* index = nullptr;
    std::uint32_t entries = 0;
    const std::uint8_t* data = nullptr;
    std::uint32_t data_size = 0;
    size_t total_size = 0;
};

Result ParseHeaderAt(std::span<const std::uint8_t> bytes, size_t offset, HeaderView& out) {
    if (offset + kHeaderIntroSize > bytes.size())
        return Result::Fail(ErrorCode::MalformedPackage, "rpm header truncated");
    const std::uint8_t* p = bytes.data() + offset;
    if (std::memcmp(p, kHeaderMagic, sizeof(kHeaderMagic)) != 0)
        return Result::Fail(ErrorCode::MalformedPackage, "bad rpm header magic");

    out.entries = ReadBe32(p + 8);
    out.data_size = ReadBe32(p + 12);
    if (out.entries > kMaxIndexEntries || out.data_size > kMaxDataSize)
        return Result::Fail(ErrorCode::MalformedPackage, "rpm header too large");

    const size_t index_bytes = static_cast<size_t>(out.entries) * kIndexEntrySize;
    out.total_size = kHeaderIntroSize + index_bytes + out.data_size;
    if (offset + out.total_size > bytes.size())
        return Result::Fail(ErrorCode::MalformedPackage, "rpm header data truncated");

    out.index = p + kHeaderIntroSize;
    out.data = out.index + index_bytes;
    return Result::Ok();
}

bool ReadString(const HeaderView& h, std::uint32_t offset, std::string& out) {
    if (offset >= h.data_size) return false;
    const auto* begin = reinterpret_cast<const char*>(h.data + offset);
    const void* nul = std::memchr(begin, '\0', h.data_size - offset);
    if (!nul) return false;
    out.assign(begin, static_cast<const char*>(nul));
    return true;
}

} // namespace

bool HasRpmLeadMagic(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= sizeof(kLeadMagic) &&
           std::memcmp(bytes.data(), kLeadMagic, sizeof(kLeadMagic)) == 0;
}

Result ReadRpmHeader(std::span<const std::uint8_t> bytes, RpmHeaderInfo& out) {
    out = RpmHeaderInfo{};
    if (bytes.size() < kLeadSize || !HasRpmLeadMagic(bytes))
        return Result::Fail(ErrorCode::MalformedPackage, "not an rpm file (bad lead)");

    HeaderView sig;
    auto sr = ParseHeaderAt(bytes, kLeadSize, sig);
    if (!sr.is_ok())
        return Result::Wrap(sr, "signature header");

    // The signature header is padded to an 8-byte boundary.
    size_t main_offset = kLeadSize + sig.total_size;
    main_offset = (main_offset + 7) & ~static_cast<size_t>(7);

    HeaderView main;
    auto mr = ParseHeaderAt(bytes, main_offset, main);
    if (!mr.is_ok())
        return Result::Wrap(mr, "main header");

    bool has_source_rpm = false;
    for (std::uint32_t i = 0; i < main.entries; ++i) {
        const std::uint8_t* e = main.index + static_cast<size_t>(i) * kIndexEntrySize;
        const std::uint32_t tag = ReadBe32(e);
        const std::uint32_t type = ReadBe32(e + 4);
        const std::uint32_t offset = ReadBe32(e + 8);

        std::string* target = nullptr;
        switch (tag) {
            case rpmtag::kName:    target = &out.name; break;
            case rpmtag::kVersion: target = &out.version; break;
            case rpmtag::kRelease: target = &out.release; break;
            case rpmtag::kArch:    target = &out.arch; break;
            case rpmtag::kOs:      target = &out.os; break;
            case rpmtag::kSourceRpm:
                has_source_rpm = true;
                continue;
            case rpmtag::kEpoch:
                if (type != kTypeInt32) continue;
                if (offset > main.data_size || main.data_size - offset < 4)
                    return Result::Fail(ErrorCode::MalformedPackage, "rpm epoch outside header data");
                out.epoch = std::to_string(ReadBe32(main.data + offset));
                continue;
            default:
                continue;
        }

        if (type != kTypeString && type != kTypeI18nString)
            return Result::Fail(ErrorCode::MalformedPackage,
                                "unexpected type for rpm tag " + std::to_string(tag));
        if (!ReadString(main, offset, *target))
            return Result::Fail(ErrorCode::MalformedPackage,
                                "unterminated string for rpm tag " + std::to_string(tag));
    }

    if (out.name.empty() || out.version.empty() || out.arch.empty())
        return Result::Fail(ErrorCode::MalformedPackage, "rpm header lacks name/version/arch");

    out.source_package = !has_source_rpm;
    return Result::Ok();
}

} // namespace pkgrepo
