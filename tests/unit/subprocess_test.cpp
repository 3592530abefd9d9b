#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <string>
#include <vector>

#include "gradebox/common/subprocess.hpp"

namespace gradebox::common {
namespace {

using std::chrono_literals::operator""ms;

auto Shell(const std::string& script) -> std::vector<std::string> {
  return {"/bin/sh", "-c", script};
}

TEST(SubprocessTest, CapturesStdoutAndExitCode) {
  auto result = RunSubprocess(Shell("printf 'hello\\n'; exit 3"));

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->exited);
  EXPECT_EQ(result->exit_code, 3);
  EXPECT_EQ(result->stdout_text, "hello\n");
  EXPECT_FALSE(result->Succeeded());
}

TEST(SubprocessTest, SeparatesStderr) {
  auto result = RunSubprocess(Shell("echo out; echo err >&2"));

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->Succeeded());
  EXPECT_EQ(result->stdout_text, "out\n");
  EXPECT_EQ(result->stderr_text, "err\n");
}

TEST(SubprocessTest, FeedsStdin) {
  SubprocessOptions options;
  options.stdin_data = "5 3\n";

  auto result = RunSubprocess(Shell("read a b; echo $((a + b))"), options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_text, "8\n");
}

TEST(SubprocessTest, FeedsLargeStdinWhileDraining) {
  // Larger than a pipe buffer in both directions
  SubprocessOptions options;
  options.stdin_data = std::string(1 << 20, 'x');

  auto result = RunSubprocess({"/bin/cat"}, options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->Succeeded());
  EXPECT_EQ(result->stdout_text.size(), options.stdin_data.size());
}

TEST(SubprocessTest, ChildIgnoringStdinDoesNotBreakCaller) {
  SubprocessOptions options;
  options.stdin_data = std::string(1 << 20, 'x');

  auto result = RunSubprocess(Shell("echo done"), options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_text, "done\n");
}

TEST(SubprocessTest, TimeoutKillsProcess) {
  SubprocessOptions options;
  options.timeout = 300ms;

  auto start = std::chrono::steady_clock::now();
  auto result = RunSubprocess(Shell("while :; do :; done"), options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->timed_out);
  EXPECT_FALSE(result->Succeeded());
  EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST(SubprocessTest, TimeoutKillsDescendantsHoldingPipes) {
  // The background sleep inherits stdout; without a group kill the caller
  // would wait for it to close the pipe.
  SubprocessOptions options;
  options.timeout = 300ms;

  auto start = std::chrono::steady_clock::now();
  auto result = RunSubprocess(Shell("sleep 30 & sleep 30; wait"), options);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->timed_out);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SubprocessTest, LingeringDescendantDoesNotStallAfterExit) {
  auto start = std::chrono::steady_clock::now();
  auto result = RunSubprocess(Shell("sleep 30 & echo parent done"));
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_TRUE(result->exited);
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->stdout_text, "parent done\n");
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(SubprocessTest, ReportsTerminatingSignal) {
  auto result = RunSubprocess(Shell("kill -SEGV $$"));

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_FALSE(result->exited);
  EXPECT_TRUE(result->signaled);
  EXPECT_EQ(result->term_signal, SIGSEGV);
}

TEST(SubprocessTest, StdoutCapTruncates) {
  SubprocessOptions options;
  options.max_stdout_bytes = 10;

  auto result = RunSubprocess(Shell("yes | head -c 100000"), options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_text.size(), 10U);
  EXPECT_TRUE(result->stdout_truncated);
  EXPECT_FALSE(result->stderr_truncated);
}

TEST(SubprocessTest, MissingExecutableIsAnError) {
  auto result = RunSubprocess({"/nonexistent/gradebox-no-such-tool"});

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("exec failed"), std::string::npos);
}

TEST(SubprocessTest, EmptyArgvIsAnError) {
  auto result = RunSubprocess({});

  EXPECT_FALSE(result.has_value());
}

TEST(SubprocessTest, RunsInWorkingDirectory) {
  SubprocessOptions options;
  options.working_dir = "/";

  auto result = RunSubprocess(Shell("pwd"), options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_EQ(result->stdout_text, "/\n");
}

TEST(SubprocessTest, MissingWorkingDirectoryIsAnError) {
  SubprocessOptions options;
  options.working_dir = "/nonexistent/gradebox-dir";

  auto result = RunSubprocess(Shell("true"), options);

  ASSERT_FALSE(result.has_value());
  EXPECT_NE(result.error().find("chdir"), std::string::npos);
}

TEST(SubprocessTest, CpuLimitStopsBusyLoop) {
  SubprocessOptions options;
  options.limits.cpu_seconds = 1;
  options.timeout = std::chrono::seconds(10);

  auto result = RunSubprocess(Shell("while :; do :; done"), options);

  ASSERT_TRUE(result.has_value()) << result.error();
  EXPECT_FALSE(result->timed_out);
  EXPECT_TRUE(result->signaled);
}

}  // namespace
}  // namespace gradebox::common
