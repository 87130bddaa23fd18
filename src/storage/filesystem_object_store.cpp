#include "storage/filesystem_object_store.hpp"

#include "crypto/sha256.hpp"
#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pkgrepo {

namespace {

constexpr const char* kStoreLockName = ".pkgrepo-store.lock";
constexpr const char* kTempMarker = ".tmp-";

// Exclusive flock on the store lock file for the lifetime of the object.
class StoreLock {
public:
    static Result Acquire(const std::string& root, StoreLock& out) {
        const std::string path = root + "/" + kStoreLockName;
        const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd < 0)
            return Result::Fail(ErrorCode::StorageError,
                                "cannot open store lock " + path + ": " + std::strerror(errno));
        out.fd_.Reset(fd);
        while (::flock(fd, LOCK_EX) != 0) {
            if (errno == EINTR) continue;
            return Result::Fail(ErrorCode::StorageError,
                                std::string("flock failed: ") + std::strerror(errno));
        }
        return Result::Ok();
    }

    ~StoreLock() {
        if (fd_.Valid()) (void)::flock(fd_.Get(), LOCK_UN);
    }

private:
    Fd fd_;
};

bool HasDotDotComponent(const std::string& key) {
    size_t start = 0;
    while (start <= key.size()) {
        size_t end = key.find('/', start);
        if (end == std::string::npos) end = key.size();
        if (key.compare(start, end - start, "..") == 0) return true;
        start = end + 1;
    }
    return false;
}

} // namespace

Result FilesystemObjectStore::Open(const std::string& root, FilesystemObjectStore& out) {
    if (root.empty())
        return Result::Fail(ErrorCode::InvalidConfig, "filesystem store root is empty");
    std::error_code ec;
    fs::create_directories(fs::path(root), ec);
    if (ec)
        return Result::Fail(ErrorCode::StorageError, "cannot create store root " + root + ": " + ec.message());
    out.root_ = fs::absolute(fs::path(root), ec).lexically_normal().string();
    while (out.root_.size() > 1 && out.root_.back() == '/') out.root_.pop_back();
    return Result::Ok();
}

Result FilesystemObjectStore::PathFor(const std::string& key, std::string& out_path) const {
    const std::string norm = NormalizeKey(key);
    if (norm.empty() || norm != key || HasDotDotComponent(norm) ||
        KeyBaseName(norm) == kStoreLockName || norm.find(kTempMarker) != std::string::npos) {
        return Result::Fail(ErrorCode::StorageError, "invalid object key: " + key);
    }
    out_path = root_ + "/" + norm;
    return Result::Ok();
}

Result FilesystemObjectStore::CurrentToken(const std::string& path, bool& exists, VersionToken& token) const {
    exists = false;
    token.clear();
    std::error_code ec;
    if (!fs::is_regular_file(fs::path(path), ec)) return Result::Ok();
    exists = true;
    return Sha256HexFile(path, token);
}

Result FilesystemObjectStore::CheckPrecondition(const std::string& key,
                                                const std::string& path,
                                                const Precondition& pre) const {
    if (pre.kind == Precondition::Kind::None) return Result::Ok();
    bool exists = false;
    VersionToken token;
    auto r = CurrentToken(path, exists, token);
    if (!r.is_ok()) return r;
    if (pre.kind == Precondition::Kind::IfAbsent && exists)
        return Result::Fail(ErrorCode::PreconditionFailed, "object exists: " + key);
    if (pre.kind == Precondition::Kind::IfMatch && (!exists || token != pre.token))
        return Result::Fail(ErrorCode::PreconditionFailed, "version mismatch: " + key);
    return Result::Ok();
}

Result FilesystemObjectStore::Get(const std::string& key, StoredObject& out) {
    std::string path;
    auto pr = PathFor(key, path);
    if (!pr.is_ok()) return pr;

    auto r = ReadFileBytes(path, out.data);
    if (!r.is_ok()) {
        if (r.err == ErrorCode::NotFound)
            return Result::Fail(ErrorCode::NotFound, "no such key: " + key);
        return r;
    }
    out.token = Sha256Hex(out.data);
    return Result::Ok();
}

Result FilesystemObjectStore::Put(const std::string& key,
                                  std::span<const std::uint8_t> data,
                                  const Precondition& pre,
                                  VersionToken* out_token) {
    std::string path;
    auto pr = PathFor(key, path);
    if (!pr.is_ok()) return pr;

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec)
        return Result::Fail(ErrorCode::StorageError, "cannot create directory for " + key + ": " + ec.message());

    StoreLock lock;
    auto lr = StoreLock::Acquire(root_, lock);
    if (!lr.is_ok()) return lr;

    auto cr = CheckPrecondition(key, path, pre);
    if (!cr.is_ok()) return cr;

    auto wr = WriteFileBytes(path, data);
    if (!wr.is_ok()) return wr;
    if (out_token) *out_token = Sha256Hex(data);
    return Result::Ok();
}

Result FilesystemObjectStore::Delete(const std::string& key, const Precondition& pre) {
    std::string path;
    auto pr = PathFor(key, path);
    if (!pr.is_ok()) return pr;

    StoreLock lock;
    auto lr = StoreLock::Acquire(root_, lock);
    if (!lr.is_ok()) return lr;

    auto cr = CheckPrecondition(key, path, pre);
    if (!cr.is_ok()) return cr;

    if (::unlink(path.c_str()) != 0 && errno != ENOENT)
        return Result::Fail(ErrorCode::StorageError, "unlink failed for " + key + ": " + std::strerror(errno));
    return Result::Ok();
}

Result FilesystemObjectStore::List(const std::string& prefix, std::vector<std::string>& out_keys) {
    out_keys.clear();
    // Walk from the deepest directory fully named by the prefix.
    const auto slash = prefix.rfind('/');
    const fs::path start = slash == std::string::npos ? fs::path(root_)
                                                       : fs::path(root_) / prefix.substr(0, slash);
    std::error_code ec;
    if (!fs::is_directory(start, ec)) return Result::Ok();

    fs::recursive_directory_iterator it(start, ec), end;
    if (ec)
        return Result::Fail(ErrorCode::StorageError, "cannot list " + prefix + ": " + ec.message());
    for (; it != end; it.increment(ec)) {
        if (ec)
            return Result::Fail(ErrorCode::StorageError, "cannot list " + prefix + ": " + ec.message());
        if (!it->is_regular_file(ec)) continue;
        std::string key = fs::relative(it->path(), fs::path(root_), ec).generic_string();
        if (ec || key.empty()) continue;
        if (KeyBaseName(key) == kStoreLockName || key.find(kTempMarker) != std::string::npos) continue;
        if (StartsWith(key, prefix)) out_keys.push_back(std::move(key));
    }
    std::sort(out_keys.begin(), out_keys.end());
    return Result::Ok();
}

} // namespace pkgrepo
