#include "util/process.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <chrono>

namespace pkgrepo {
namespace {

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "echo hello; echo oops >&2; exit 3"};
    ProcessOutput out;
    auto r = RunProcess(spec, out);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.out, "hello\n");
    EXPECT_EQ(out.err, "oops\n");
    EXPECT_FALSE(out.timed_out);
}

TEST(ProcessTest, FeedsStdin) {
    ProcessSpec spec;
    spec.argv = {"cat"};
    spec.stdin_data = std::string(100000, 'z');
    ProcessOutput out;
    ASSERT_TRUE(RunProcess(spec, out).ok);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.out, spec.stdin_data);
}

TEST(ProcessTest, EnvironmentAndWorkingDirectory) {
    testutil::TemporaryDirectory tmp;
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "printf '%s:%s' \"$PKGREPO_TEST_VAR\" \"$(pwd)\""};
    spec.env = {{"PKGREPO_TEST_VAR", "set"}};
    spec.cwd = tmp.Path();
    ProcessOutput out;
    ASSERT_TRUE(RunProcess(spec, out).ok);
    EXPECT_EQ(out.out, "set:" + tmp.Path());
}

TEST(ProcessTest, TimeoutKillsChild) {
    ProcessSpec spec;
    spec.argv = {"sleep", "10"};
    spec.timeout = std::chrono::milliseconds(200);
    ProcessOutput out;
    auto r = RunProcess(spec, out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::Timeout);
    EXPECT_TRUE(out.timed_out);
}

TEST(ProcessTest, TimeoutHoldsAfterChildClosesItsOutput) {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "exec >&- 2>&-; sleep 10"};
    spec.timeout = std::chrono::milliseconds(300);
    ProcessOutput out;
    const auto start = std::chrono::steady_clock::now();
    auto r = RunProcess(spec, out);
    EXPECT_EQ(r.err, ErrorCode::Timeout);
    EXPECT_TRUE(out.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(ProcessTest, MissingExecutableIsInvalidConfig) {
    ProcessSpec spec;
    spec.argv = {"/nonexistent/pkgrepo-tool"};
    ProcessOutput out;
    EXPECT_EQ(RunProcess(spec, out).err, ErrorCode::InvalidConfig);

    spec.argv.clear();
    EXPECT_EQ(RunProcess(spec, out).err, ErrorCode::InvalidConfig);
}

TEST(ProcessTest, CheckedMapsNonZeroExitToFailureCode) {
    ProcessSpec spec;
    spec.argv = {"sh", "-c", "echo broken index >&2; exit 1"};
    ProcessOutput out;
    auto r = RunProcessChecked(spec, out, ErrorCode::MetadataBuildFailed);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ErrorCode::MetadataBuildFailed);
    EXPECT_EQ(r.msg, "sh exited with 1: broken index");

    spec.argv = {"true"};
    EXPECT_TRUE(RunProcessChecked(spec, out, ErrorCode::MetadataBuildFailed).ok);
}

TEST(ProcessTest, DescribeCommandJoinsArgs) {
    EXPECT_EQ(DescribeCommand({"rpm", "--addsign", "x.rpm"}), "rpm --addsign x.rpm");
}

} // namespace
} // namespace pkgrepo
