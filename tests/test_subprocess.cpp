#include <gtest/gtest.h>
#include <chrono>
#include "utils/SubProcess.hpp"

namespace evalbox {
namespace {

TEST(SubProcessTest, CapturesStdoutAndExitCode) {
    auto res = SubProcess::run("echo hello");
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(res.stdout_data, "hello\n");
    EXPECT_EQ(res.output, "hello\n");
}

TEST(SubProcessTest, SeparatesStreams) {
    auto res = SubProcess::run("echo out; echo err >&2; exit 3");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.stdout_data, "out\n");
    EXPECT_EQ(res.stderr_data, "err\n");
    EXPECT_NE(res.output.find("out"), std::string::npos);
    EXPECT_NE(res.output.find("err"), std::string::npos);
}

TEST(SubProcessTest, FeedsStdin) {
    ProcessOptions options;
    options.stdin_data = "line1\nline2\n";
    auto res = SubProcess::run(std::vector<std::string>{"cat"}, options);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.stdout_data, "line1\nline2\n");
}

TEST(SubProcessTest, LargeStdinDoesNotDeadlock) {
    ProcessOptions options;
    options.stdin_data = std::string(1 << 20, 'x');
    options.timeout = std::chrono::seconds(30);
    auto res = SubProcess::run(std::vector<std::string>{"cat"}, options);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.stdout_data.size(), options.stdin_data.size());
}

TEST(SubProcessTest, DeadlineKillsProcessGroup) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(500);
    auto begin = std::chrono::steady_clock::now();
    auto res = SubProcess::run("sleep 30 & sleep 30; wait", options);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_TRUE(res.timed_out);
    EXPECT_FALSE(res.success);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(SubProcessTest, PassesExtraEnvironment) {
    ProcessOptions options;
    options.environment["EVALBOX_PROBE"] = "present";
    auto res = SubProcess::run("printf %s \"$EVALBOX_PROBE\"", options);
    EXPECT_EQ(res.stdout_data, "present");
}

TEST(SubProcessTest, MissingBinaryFails) {
    auto res = SubProcess::run(std::vector<std::string>{"/nonexistent/evalbox-binary"});
    EXPECT_FALSE(res.success);
    EXPECT_NE(res.exit_code, 0);
}

TEST(ChildProcessTest, StreamsIncrementally) {
    ChildProcess child({"/bin/sh", "-c", "read x; echo got:$x"});
    child.write_stdin("ping\n");
    child.close_stdin();

    std::string out;
    while (child.poll(std::chrono::milliseconds(100))) {
        out += child.read_stdout();
    }
    out += child.read_stdout();
    EXPECT_EQ(child.wait(), 0);
    EXPECT_EQ(out, "got:ping\n");
    ASSERT_TRUE(child.exit_code().has_value());
    EXPECT_EQ(*child.exit_code(), 0);
}

TEST(ChildProcessTest, KillReportsSignal) {
    ChildProcess child({"sleep", "30"});
    child.kill();
    int code = child.wait();
    EXPECT_GE(code, 128);
}

} // namespace
} // namespace evalbox
