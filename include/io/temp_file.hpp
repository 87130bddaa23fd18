#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace pkgrepo {

// Unlinked on destruction.
class TempFile {
public:
    static Result Create(TempFile& out, const std::string& suffix = {});

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

// Removed recursively on destruction.
class TempDirectory {
public:
    static Result Create(const std::string& prefix, TempDirectory& out);

    TempDirectory() = default;
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    ~TempDirectory();

    const std::string& Path() const { return path_; }

private:
    void Cleanup();

    std::string path_;
};

} // namespace pkgrepo
