#include "io/file_reader.hpp"
#include "testing.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace {

class FileReaderTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    std::string MakePath(const std::string& name) { return tmp.Path() + "/" + name; }

    void WriteFile(const std::string& path, const std::vector<std::uint8_t>& data) {
        std::ofstream os(path, std::ios::binary);
        ASSERT_TRUE(os.good());
        os.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
        os.close();
        ASSERT_TRUE(os.good());
    }
};

TEST_F(FileReaderTests, OpenOK_AndTotalSizeMatches) {
    const std::string p = MakePath("in.bin");
    std::vector<std::uint8_t> data(12345);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>(i & 0xFF);
    WriteFile(p, data);

    pkgrepo::FileOrStdinReader r;
    auto res = pkgrepo::FileOrStdinReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    auto sz = r.TotalSize();
    ASSERT_TRUE(sz.has_value());
    EXPECT_EQ(*sz, data.size());
}

TEST_F(FileReaderTests, OpenNonexistent_Fails) {
    pkgrepo::FileOrStdinReader r;
    auto res = pkgrepo::FileOrStdinReader::Open(MakePath("nope.bin"), r);
    ASSERT_FALSE(res.ok);
}

TEST_F(FileReaderTests, ReadAllBytes_EqualsInput) {
    const std::string p = MakePath("in2.bin");
    std::vector<std::uint8_t> data(2 * 1024 * 1024 + 7);
    for (size_t i = 0; i < data.size(); ++i)
        data[i] = static_cast<std::uint8_t>((i * 13) & 0xFF);
    WriteFile(p, data);

    pkgrepo::FileOrStdinReader r;
    auto res = pkgrepo::FileOrStdinReader::Open(p, r);
    ASSERT_TRUE(res.ok) << res.msg;

    std::vector<std::uint8_t> out;
    out.resize(data.size());

    size_t pos = 0;
    while (pos < out.size()) {
        std::span<std::uint8_t> buf(out.data() + pos, out.size() - pos);
        ssize_t n = r.Read(buf);
        ASSERT_GE(n, 0);
        if (n == 0)
            break;
        pos += static_cast<size_t>(n);
    }

    ASSERT_EQ(pos, data.size());
    EXPECT_EQ(out, data);
}

TEST_F(FileReaderTests, WriteFileBytesReplacesContents) {
    const std::string p = MakePath("out.bin");
    WriteFile(p, {1, 2, 3});

    const pkgrepo::Bytes next = pkgrepo::ToBytes("replacement");
    auto res = pkgrepo::WriteFileBytes(p, next);
    ASSERT_TRUE(res.ok) << res.msg;

    pkgrepo::Bytes back;
    ASSERT_TRUE(pkgrepo::ReadFileBytes(p, back).ok);
    EXPECT_EQ(back, next);
}

TEST_F(FileReaderTests, ReadFileBytesMissingFileFails) {
    pkgrepo::Bytes back;
    EXPECT_FALSE(pkgrepo::ReadFileBytes(MakePath("missing"), back).ok);
}

} // namespace
