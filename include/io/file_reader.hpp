#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace pkgrepo {

class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

Result ReadFileBytes(const std::string& path, Bytes& out);
// Atomic replace: write to a sibling temp file, fsync, rename.
Result WriteFileBytes(const std::string& path, std::span<const std::uint8_t> data);
Result WriteAllToFd(int fd, std::span<const std::uint8_t> data);

} // namespace pkgrepo
