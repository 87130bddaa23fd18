#include "package/deb_control.hpp"

#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstring>
#include <memory>
#include <vector>

namespace pkgrepo {

namespace {

constexpr char kArMagic[] = "!<arch>\n";
constexpr size_t kMaxControlMember = 64u * 1024u * 1024u;

struct ArchiveDeleter {
    void operator()(archive* a) const {
        if (a) (void)archive_read_free(a);
    }
};
using ArchivePtr = std::unique_ptr<archive, ArchiveDeleter>;

std::string Trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return std::string(s.substr(b, e - b));
}

Result ReadCurrentEntry(archive* a, std::vector<std::uint8_t>& out) {
    out.clear();
    char buf[16 * 1024];
    while (true) {
        const la_ssize_t n = archive_read_data(a, buf, sizeof(buf));
        if (n < 0)
            return Result::Fail(ErrorCode::MalformedPackage,
                                std::string("archive read failed: ") + archive_error_string(a));
        if (n == 0) break;
        if (out.size() + static_cast<size_t>(n) > kMaxControlMember)
            return Result::Fail(ErrorCode::MalformedPackage, "control member too large");
        out.insert(out.end(), buf, buf + n);
    }
    return Result::Ok();
}

ArchivePtr OpenMemory(std::span<const std::uint8_t> bytes, bool ar_container) {
    ArchivePtr a(archive_read_new());
    if (!a) return nullptr;
    if (ar_container) {
        archive_read_support_format_ar(a.get());
        archive_read_support_filter_none(a.get());
    } else {
        archive_read_support_format_tar(a.get());
        archive_read_support_filter_all(a.get());
    }
    if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK)
        return nullptr;
    return a;
}

Result ExtractControlTar(std::span<const std::uint8_t> bytes, std::vector<std::uint8_t>& out) {
    ArchivePtr a = OpenMemory(bytes, true);
    if (!a)
        return Result::Fail(ErrorCode::MalformedPackage, "cannot open deb ar container");

    archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN)
            return Result::Fail(ErrorCode::MalformedPackage,
                                std::string("deb ar read failed: ") + archive_error_string(a.get()));
        const char* name = archive_entry_pathname(entry);
        if (name && StartsWith(name, "control.tar"))
            return ReadCurrentEntry(a.get(), out);
        (void)archive_read_data_skip(a.get());
    }
    return Result::Fail(ErrorCode::MalformedPackage, "deb has no control.tar member");
}

} // namespace

std::string DebControl::Get(const std::string& field) const {
    auto it = fields.find(field);
    return it == fields.end() ? std::string{} : it->second;
}

bool HasDebMagic(std::span<const std::uint8_t> bytes) {
    const size_t n = sizeof(kArMagic) - 1;
    return bytes.size() >= n && std::memcmp(bytes.data(), kArMagic, n) == 0;
}

DebControl ParseDebControlText(std::string_view text) {
    DebControl out;
    std::string last;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        const std::string_view line = text.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.empty() || line == "\r") {
            // Only the first stanza describes the binary package.
            if (!out.fields.empty()) break;
            continue;
        }
        if ((line.front() == ' ' || line.front() == '\t') && !last.empty()) {
            out.fields[last] += "\n" + Trim(line);
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        last = Trim(line.substr(0, colon));
        out.fields[last] = Trim(line.substr(colon + 1));
    }
    return out;
}

Result ReadDebControl(std::span<const std::uint8_t> bytes, DebControl& out) {
    out = DebControl{};
    if (!HasDebMagic(bytes))
        return Result::Fail(ErrorCode::MalformedPackage, "not a deb file (bad ar magic)");

    std::vector<std::uint8_t> control_tar;
    auto cr = ExtractControlTar(bytes, control_tar);
    if (!cr.is_ok()) return cr;

    ArchivePtr a = OpenMemory(control_tar, false);
    if (!a)
        return Result::Fail(ErrorCode::MalformedPackage, "cannot open control.tar");

    archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(a.get(), &entry);
        if (rc == ARCHIVE_EOF) break;
        if (rc != ARCHIVE_OK && rc != ARCHIVE_WARN)
            return Result::Fail(ErrorCode::MalformedPackage,
                                std::string("control.tar read failed: ") + archive_error_string(a.get()));
        const char* name = archive_entry_pathname(entry);
        if (name && NormalizeKey(name) == "control") {
            std::vector<std::uint8_t> text;
            auto rr = ReadCurrentEntry(a.get(), text);
            if (!rr.is_ok()) return rr;
            out = ParseDebControlText(
                std::string_view(reinterpret_cast<const char*>(text.data()), text.size()));
            if (out.Get("Package").empty() || out.Get("Version").empty() ||
                out.Get("Architecture").empty()) {
                return Result::Fail(ErrorCode::MalformedPackage,
                                    "deb control lacks Package/Version/Architecture");
            }
            return Result::Ok();
        }
        (void)archive_read_data_skip(a.get());
    }
    return Result::Fail(ErrorCode::MalformedPackage, "control.tar has no control file");
}

} // namespace pkgrepo
