#include "io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace pkgrepo {

namespace {

std::string TempRoot() {
    const char* env = std::getenv("TMPDIR");
    return (env && *env) ? std::string(env) : std::string("/tmp");
}

} // namespace

Result TempFile::Create(TempFile& out, const std::string& suffix) {
    std::string tmpl = TempRoot() + "/pkgrepo-XXXXXX" + suffix;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0)
        return Result::Fail(ErrorCode::StorageError,
                            std::string("mkstemps failed: ") + std::strerror(errno));
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

Result TempDirectory::Create(const std::string& prefix, TempDirectory& out) {
    out.Cleanup();
    std::string tmpl = TempRoot() + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    char* created = ::mkdtemp(buf.data());
    if (!created)
        return Result::Fail(ErrorCode::StorageError,
                            std::string("mkdtemp failed: ") + std::strerror(errno));
    out.path_ = created;
    return Result::Ok();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

TempDirectory::~TempDirectory() { Cleanup(); }

void TempDirectory::Cleanup() {
    if (path_.empty())
        return;
    std::error_code ec;
    fs::remove_all(fs::path(path_), ec);
    path_.clear();
}

} // namespace pkgrepo
