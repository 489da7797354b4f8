#include "sandcell/utils/process_runner.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <system_error>

using sandcell::utils::ProcessOptions;
using sandcell::utils::ProcessResult;
using sandcell::utils::RunProcess;

namespace {

ProcessResult Sh(const std::string& script, const ProcessOptions& options = {}) {
    return RunProcess({"/bin/sh", "-c", script}, options);
}

ProcessOptions WithTimeout(int ms) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(ms);
    return options;
}

} // namespace

TEST(ProcessRunnerTest, CapturesStdout) {
    auto result = Sh("echo hi");
    EXPECT_EQ(result.stdout_output, "hi\n");
    EXPECT_EQ(result.stderr_output, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, KeepsStreamsSeparate) {
    auto result = Sh("echo out; echo err >&2");
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
}

TEST(ProcessRunnerTest, ReportsExitCode) {
    EXPECT_EQ(Sh("exit 3").exit_code, 3);
}

TEST(ProcessRunnerTest, ReportsTerminatingSignal) {
    auto result = Sh("kill -9 $$");
    EXPECT_EQ(result.term_signal, 9);
    EXPECT_EQ(result.exit_code, 137);
}

TEST(ProcessRunnerTest, DeliversStdin) {
    ProcessOptions options;
    options.stdin_data = "line one\nline two\n";
    auto result = RunProcess({"/bin/cat"}, options);
    EXPECT_EQ(result.stdout_output, "line one\nline two\n");
}

TEST(ProcessRunnerTest, DeliversStdinLargerThanPipeBuffer) {
    ProcessOptions options;
    options.stdin_data = std::string(1 << 20, 'x');
    auto result = RunProcess({"/bin/cat"}, options);
    EXPECT_EQ(result.stdout_output.size(), options.stdin_data.size());
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunnerTest, ChildIgnoringStdinDoesNotBlock) {
    ProcessOptions options = WithTimeout(5000);
    options.stdin_data = std::string(1 << 20, 'x');
    auto result = RunProcess({"/bin/sh", "-c", "exec 0<&-; echo done"}, options);
    EXPECT_EQ(result.stdout_output, "done\n");
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessRunnerTest, KillsAtDeadline) {
    auto result = Sh("sleep 5", WithTimeout(200));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.term_signal, 9);
    EXPECT_LT(result.duration, std::chrono::milliseconds(4000));
}

TEST(ProcessRunnerTest, KillsAtDeadlineAfterOutputIsClosed) {
    auto result = Sh("exec >/dev/null 2>&1; sleep 5", WithTimeout(300));
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration, std::chrono::milliseconds(4000));
}

TEST(ProcessRunnerTest, KeepsOutputProducedBeforeDeadline) {
    auto result = Sh("echo partial; sleep 5", WithTimeout(300));
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.stdout_output, "partial\n");
}

TEST(ProcessRunnerTest, TruncatesAtCap) {
    ProcessOptions options;
    options.max_output_bytes = 1000;
    auto result = Sh("i=0; while [ $i -lt 2000 ]; do echo 0123456789; i=$((i+1)); done", options);

    EXPECT_EQ(result.stdout_output.size(), 1000u);
    EXPECT_TRUE(result.stdout_truncated);
    EXPECT_FALSE(result.stderr_truncated);
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessRunnerTest, MissingProgramThrows) {
    EXPECT_THROW(RunProcess({"/nonexistent/sandcell-binary"}), std::system_error);
}

TEST(ProcessRunnerTest, EmptyArgvThrows) {
    EXPECT_THROW(RunProcess({}), std::invalid_argument);
}
