#include "package/deb_control.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace pkgrepo {
namespace {

TEST(DebControlTest, ParsesFieldsAndFoldsContinuations) {
    const auto c = ParseDebControlText("Package: hello\n"
                                       "Version: 2.10-3\n"
                                       "Architecture: amd64\n"
                                       "Description: greeting\n"
                                       " longer text\n"
                                       "\n"
                                       "Package: ignored\n");
    EXPECT_EQ(c.Get("Package"), "hello");
    EXPECT_EQ(c.Get("Version"), "2.10-3");
    EXPECT_EQ(c.Get("Architecture"), "amd64");
    EXPECT_EQ(c.Get("Description"), "greeting\nlonger text");
    EXPECT_EQ(c.Get("Missing"), "");
}

TEST(DebControlTest, ReadsControlFromArchive) {
    const auto bytes = testutil::BuildDeb("hello", "1:2.10-3~bookworm", "arm64");
    EXPECT_TRUE(HasDebMagic(bytes));

    DebControl c;
    auto r = ReadDebControl(bytes, c);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(c.Get("Package"), "hello");
    EXPECT_EQ(c.Get("Version"), "1:2.10-3~bookworm");
    EXPECT_EQ(c.Get("Architecture"), "arm64");
}

TEST(DebControlTest, RejectsNonArchive) {
    DebControl c;
    auto r = ReadDebControl(ToBytes("definitely not a deb"), c);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MalformedPackage);
}

TEST(DebControlTest, RejectsArchiveWithoutControlMember) {
    std::vector<std::uint8_t> bytes{'!', '<', 'a', 'r', 'c', 'h', '>', '\n'};
    testutil::AppendArMember(bytes, "debian-binary", ToBytes("2.0\n"));

    DebControl c;
    auto r = ReadDebControl(bytes, c);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MalformedPackage);
}

TEST(DebControlTest, RejectsControlWithoutIdentity) {
    std::vector<std::uint8_t> bytes{'!', '<', 'a', 'r', 'c', 'h', '>', '\n'};
    testutil::AppendArMember(bytes, "debian-binary", ToBytes("2.0\n"));
    testutil::AppendArMember(
        bytes, "control.tar.gz",
        testutil::Gzip(testutil::BuildTar({{"./control", "Package: x\n", AE_IFREG}})));

    DebControl c;
    auto r = ReadDebControl(bytes, c);
    EXPECT_FALSE(r.ok);
    EXPECT_NE(r.msg.find("Package/Version/Architecture"), std::string::npos);
}

} // namespace
} // namespace pkgrepo
