#include <gtest/gtest.h>

#include "Core/process/ProcessRunner.hpp"
#include "Virtualization/Utils/VmException.hpp"

TEST(ProcessRunnerTest, CapturesStdoutAndStderrSeparately) {
    ProcessRunner runner;
    const auto out = runner.run("/bin/sh", {"-c", "echo out; echo err 1>&2"});
    EXPECT_EQ(out.exitCode, 0);
    EXPECT_EQ(out.stdoutText, "out\n");
    EXPECT_EQ(out.stderrText, "err\n");
    EXPECT_TRUE(out.failureReason().empty());
}

TEST(ProcessRunnerTest, ReportsNonZeroExit) {
    ProcessRunner runner;
    const auto out = runner.run("/bin/sh", {"-c", "exit 3"});
    EXPECT_EQ(out.exitCode, 3);
    EXPECT_NE(out.failureReason().find("exit status 3"), std::string::npos);
}

TEST(ProcessRunnerTest, ErrorMarkerOnStderrFailsEvenWithZeroExit) {
    ProcessRunner runner;
    const auto out = runner.run("/bin/sh", {"-c", "echo 'qemu-img: error: nope' 1>&2"});
    EXPECT_EQ(out.exitCode, 0);
    EXPECT_FALSE(out.failureReason().empty());
    EXPECT_TRUE(out.failureReason("").empty());
}

TEST(ProcessRunnerTest, ArgumentsAreNotShellExpanded) {
    ProcessRunner runner;
    const auto out = runner.run("/bin/sh", {"-c", "printf '%s|' \"$@\"", "sh", "a b", "", "$HOME"});
    EXPECT_EQ(out.stdoutText, "a b||$HOME|");
}

TEST(ProcessRunnerTest, ResolvesThroughPath) {
    EXPECT_FALSE(ProcessRunner::resolve("sh").empty());
    EXPECT_EQ(ProcessRunner::resolve("/opt/none/tool"), "/opt/none/tool");
}

TEST(ProcessRunnerTest, MissingProgramIsLaunchFailure) {
    ProcessRunner runner;
    EXPECT_THROW((void)runner.run("qemuhive-definitely-missing-tool", {}), ProcessLaunchFailure);
}
