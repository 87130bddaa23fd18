#include "package/descriptor_extractor.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

namespace pkgrepo {
namespace {

TEST(DescriptorExtractorTest, RpmHeaderIdentityAndContentHash) {
    testutil::RpmSpec spec;
    spec.release = "1.el8";
    const auto bytes = testutil::BuildRpm(spec);

    DescriptorExtractor ex;
    ExtractedPackage pkg;
    auto r = ex.Extract("foo-1.0-1.el8.x86_64.rpm", bytes, pkg);
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(pkg.filename, "foo-1.0-1.el8.x86_64.rpm");
    EXPECT_EQ(pkg.descriptor.format, PackageFormat::Rpm);
    EXPECT_EQ(pkg.descriptor.name, "foo");
    EXPECT_EQ(pkg.descriptor.version, "1.0");
    EXPECT_EQ(pkg.descriptor.release, "1.el8");
    EXPECT_EQ(pkg.descriptor.architecture, "x86_64");
    EXPECT_EQ(pkg.descriptor.os_tag, "el8");
    EXPECT_EQ(pkg.descriptor.ReleaseVersion(), "8");
    EXPECT_EQ(pkg.descriptor.content_hash, Sha256Hex(bytes));
    EXPECT_TRUE(pkg.warnings.empty());
}

TEST(DescriptorExtractorTest, HeaderWinsAndMismatchIsWarned) {
    testutil::RpmSpec spec;
    spec.arch = "aarch64";
    const auto bytes = testutil::BuildRpm(spec);

    DescriptorExtractor ex;
    ExtractedPackage pkg;
    ASSERT_TRUE(ex.Extract("foo-1.0-1.x86_64.rpm", bytes, pkg).ok);
    EXPECT_EQ(pkg.descriptor.architecture, "aarch64");
    ASSERT_EQ(pkg.warnings.size(), 1u);
    EXPECT_EQ(pkg.warnings[0], "DescriptorMismatch: architecture filename=x86_64 header=aarch64");
}

TEST(DescriptorExtractorTest, SourceRpmHasSrcArch) {
    testutil::RpmSpec spec;
    spec.source = true;
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    ASSERT_TRUE(ex.Extract("foo-1.0-1.src.rpm", testutil::BuildRpm(spec), pkg).ok);
    EXPECT_EQ(pkg.descriptor.architecture, "src");
    EXPECT_TRUE(pkg.warnings.empty());
}

TEST(DescriptorExtractorTest, UnreadableHeaderFallsBackToFilename) {
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    auto r = ex.Extract("bar-2:3.1-4.fc39.noarch.rpm", ToBytes("garbage"), pkg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(pkg.descriptor.name, "bar");
    EXPECT_EQ(pkg.descriptor.epoch, "2");
    EXPECT_EQ(pkg.descriptor.version, "3.1");
    EXPECT_EQ(pkg.descriptor.release, "4.fc39");
    EXPECT_EQ(pkg.descriptor.architecture, "noarch");
    EXPECT_EQ(pkg.descriptor.os_tag, "fc39");
    ASSERT_EQ(pkg.warnings.size(), 1u);
    EXPECT_NE(pkg.warnings[0].find("identity taken from filename"), std::string::npos);
}

TEST(DescriptorExtractorTest, StrictHeadersRejectUnreadableHeader) {
    DescriptorExtractor ex(DescriptorExtractor::Options{.strict_headers = true});
    ExtractedPackage pkg;
    auto r = ex.Extract("bar-3.1-4.noarch.rpm", ToBytes("garbage"), pkg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MalformedPackage);
}

TEST(DescriptorExtractorTest, UnparseableNameAndHeaderFails) {
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    auto r = ex.Extract("noversion.rpm", ToBytes("garbage"), pkg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MalformedPackage);
}

TEST(DescriptorExtractorTest, UnknownFormatFails) {
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    auto r = ex.Extract("readme.txt", ToBytes("hello"), pkg);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MalformedPackage);
}

TEST(DescriptorExtractorTest, FormatDetectedFromMagicWithoutExtension) {
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    ASSERT_TRUE(ex.Extract("upload-1234", testutil::BuildRpm({}), pkg).ok);
    EXPECT_EQ(pkg.descriptor.format, PackageFormat::Rpm);
    EXPECT_EQ(pkg.descriptor.name, "foo");
}

TEST(DescriptorExtractorTest, DebIdentityFromControl) {
    const auto bytes = testutil::BuildDeb("hello", "1:2.10-3~bookworm", "amd64");
    DescriptorExtractor ex;
    ExtractedPackage pkg;
    auto r = ex.Extract("hello_1%3a2.10-3~bookworm_amd64.deb", bytes, pkg);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(pkg.descriptor.format, PackageFormat::Deb);
    EXPECT_EQ(pkg.descriptor.name, "hello");
    EXPECT_EQ(pkg.descriptor.epoch, "1");
    EXPECT_EQ(pkg.descriptor.version, "2.10-3~bookworm");
    EXPECT_EQ(pkg.descriptor.architecture, "amd64");
    EXPECT_EQ(pkg.descriptor.os_tag, "bookworm");
    EXPECT_TRUE(pkg.warnings.empty());
}

TEST(DescriptorExtractorTest, ParseFilenameOnly) {
    DescriptorExtractor ex;
    PackageDescriptor d;
    ASSERT_TRUE(ex.ParseFilename("repo/dir/zlib-1.2.11-40.el9.x86_64.rpm", d).ok);
    EXPECT_EQ(d.name, "zlib");
    EXPECT_EQ(d.Nevra(), "zlib-1.2.11-40.el9.x86_64");

    ASSERT_TRUE(ex.ParseFilename("libc6_2.36-9+deb12u3_arm64.deb", d).ok);
    EXPECT_EQ(d.os_tag, "deb12");
    EXPECT_EQ(d.architecture, "arm64");
}

TEST(DescriptorExtractorTest, NevraIncludesNonZeroEpoch) {
    PackageDescriptor d;
    d.name = "a";
    d.epoch = "0";
    d.version = "1";
    d.release = "2";
    d.architecture = "noarch";
    EXPECT_EQ(d.Nevra(), "a-1-2.noarch");
    d.epoch = "3";
    EXPECT_EQ(d.Nevra(), "a-3:1-2.noarch");
}

} // namespace
} // namespace pkgrepo
