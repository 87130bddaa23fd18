#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace pkgrepo {

Result ReadAll(IReader& reader, Bytes& out) {
    out.clear();
    if (auto total = reader.TotalSize()) {
        out.reserve(static_cast<size_t>(*total));
    }
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n < 0)
            return Result::Fail(ErrorCode::StorageError, "read failed");
        if (n == 0)
            break;
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        return Result::Fail(err == ENOENT ? ErrorCode::NotFound : ErrorCode::StorageError,
                            "Failed to open input: " + out.path_ + " (" + std::strerror(err) + ")");
    }
    out.fd_.Reset(fd);

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result ReadFileBytes(const std::string& path, Bytes& out) {
    FileOrStdinReader reader;
    auto r = FileOrStdinReader::Open(path, reader);
    if (!r.is_ok())
        return r;
    auto rr = ReadAll(reader, out);
    if (!rr.is_ok())
        return Result::Fail(rr.err, "read failed: " + path);
    return Result::Ok();
}

Result WriteAllToFd(int fd, std::span<const std::uint8_t> data) {
    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Result::Fail(ErrorCode::StorageError,
                                std::string("write failed: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

Result WriteFileBytes(const std::string& path, std::span<const std::uint8_t> data) {
    std::string tmpl = path + ".tmp-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int raw = ::mkstemp(buf.data());
    if (raw < 0) {
        return Result::Fail(ErrorCode::StorageError,
                            "mkstemp failed for " + path + ": " + std::strerror(errno));
    }
    Fd fd(raw);
    const std::string tmp_path(buf.data());

    auto wr = WriteAllToFd(fd.Get(), data);
    if (wr.is_ok() && ::fsync(fd.Get()) != 0) {
        wr = Result::Fail(ErrorCode::StorageError, std::string("fsync failed: ") + std::strerror(errno));
    }
    fd.Close();
    if (!wr.is_ok()) {
        ::unlink(tmp_path.c_str());
        return wr;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp_path.c_str());
        return Result::Fail(ErrorCode::StorageError,
                            "rename failed for " + path + ": " + std::strerror(err));
    }
    return Result::Ok();
}

} // namespace pkgrepo
