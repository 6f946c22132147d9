#include <feedbacker/cancellation.h>
#include <feedbacker/subprocess.h>

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "test_support/temporary_project.h"

namespace feedbacker {
namespace {

using namespace std::chrono_literals;

Deadline In(std::chrono::milliseconds duration) {
  return std::chrono::steady_clock::now() + duration;
}

ProcessSpec Shell(const std::string &script) {
  ProcessSpec spec;
  spec.argv = {"/bin/sh", "-c", script};
  return spec;
}

// True once the process is gone or only a zombie is left.
bool ProcessGone(const std::string &pid) {
  const auto stat_path = std::filesystem::path("/proc") / pid / "stat";
  for (int i = 0; i < 100; ++i) {
    std::ifstream stream(stat_path);
    if (!stream) {
      return true;
    }
    std::string content;
    std::getline(stream, content);
    const auto close = content.rfind(')');
    if (close != std::string::npos && close + 2 < content.size() &&
        content[close + 2] == 'Z') {
      return true;
    }
    std::this_thread::sleep_for(20ms);
  }
  return false;
}

TEST(SubprocessTest, CapturesOutputAndExitCode) {
  const auto result =
      RunProcess(Shell("echo out; echo err >&2; exit 3"), In(5s));

  EXPECT_EQ(ProcessStatus::kExited, result.status);
  EXPECT_EQ(3, result.exit_code);
  EXPECT_EQ("out\n", result.stdout_output);
  EXPECT_EQ("err\n", result.stderr_output);
}

TEST(SubprocessTest, RunsInWorkingDirectory) {
  test::TemporaryProject project;
  auto spec = Shell("pwd");
  spec.working_directory = project.root();

  const auto result = RunProcess(spec, In(5s));

  EXPECT_EQ(std::filesystem::canonical(project.root()).string() + "\n",
            result.stdout_output);
}

TEST(SubprocessTest, IsolatedEnvironmentHidesParentVariables) {
  ::setenv("FEEDBACKER_SECRET_FOR_TEST", "leaked", 1);
  auto spec = Shell("echo \"[$FEEDBACKER_SECRET_FOR_TEST][$ONLY_THIS]\"");
  spec.inherit_environment = false;
  spec.environment = {{"ONLY_THIS", "visible"}, {"PATH", "/usr/bin:/bin"}};

  const auto result = RunProcess(spec, In(5s));
  ::unsetenv("FEEDBACKER_SECRET_FOR_TEST");

  EXPECT_EQ("[][visible]\n", result.stdout_output);
}

TEST(SubprocessTest, DeadlineKillsWholeProcessGroup) {
  test::TemporaryProject project;
  const auto pid_file = project.root() / "child.pid";
  const auto started = std::chrono::steady_clock::now();

  const auto result = RunProcess(
      Shell("sleep 30 & echo $! > " + pid_file.string() + "; wait"), In(300ms));

  EXPECT_EQ(ProcessStatus::kTimedOut, result.status);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  std::ifstream stream(pid_file);
  std::string background_pid;
  std::getline(stream, background_pid);
  ASSERT_FALSE(background_pid.empty());
  EXPECT_TRUE(ProcessGone(background_pid));
}

TEST(SubprocessTest, CancellationStopsTheChild) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(100ms);
    token.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  const auto result = RunProcess(Shell("sleep 30"), In(30s), &token);
  canceller.join();

  EXPECT_EQ(ProcessStatus::kCancelled, result.status);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, DeadlineHoldsAfterChildClosesItsOutput) {
  const auto started = std::chrono::steady_clock::now();

  const auto result =
      RunProcess(Shell("exec >/dev/null 2>&1; sleep 30"), In(300ms));

  EXPECT_EQ(ProcessStatus::kTimedOut, result.status);
  EXPECT_EQ(-1, result.exit_code);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, CancellationHoldsAfterChildClosesItsOutput) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(100ms);
    token.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  const auto result =
      RunProcess(Shell("exec >/dev/null 2>&1; sleep 30"), In(30s), &token);
  canceller.join();

  EXPECT_EQ(ProcessStatus::kCancelled, result.status);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, ExitedChildIsNotBlamedForItsBackgroundJobs) {
  test::TemporaryProject project;
  const auto pid_file = project.root() / "child.pid";
  const auto started = std::chrono::steady_clock::now();

  const auto result = RunProcess(
      Shell("sleep 30 & echo $! > " + pid_file.string() + "; echo done; exit 0"),
      In(10s));

  EXPECT_EQ(ProcessStatus::kExited, result.status);
  EXPECT_EQ(0, result.exit_code);
  EXPECT_EQ("done\n", result.stdout_output);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);

  std::ifstream stream(pid_file);
  std::string background_pid;
  std::getline(stream, background_pid);
  ASSERT_FALSE(background_pid.empty());
  EXPECT_TRUE(ProcessGone(background_pid));
}

TEST(SubprocessTest, MissingBinaryIsLaunchFailure) {
  ProcessSpec spec;
  spec.argv = {"/nonexistent/feedbacker-tool"};

  const auto result = RunProcess(spec, In(5s));

  EXPECT_EQ(ProcessStatus::kLaunchFailed, result.status);
  EXPECT_NE(std::string::npos, result.stderr_output.find("failed to launch"));
}

TEST(SubprocessTest, OutputIsTruncatedAtLimit) {
  auto spec = Shell("yes finding | head -n 1000");
  spec.output_limit = 64;

  const auto result = RunProcess(spec, In(5s));

  EXPECT_EQ(ProcessStatus::kExited, result.status);
  EXPECT_EQ(64u, result.stdout_output.size());
}

TEST(SubprocessTest, ForkedTaskOutputAndExitCodeAreCaptured) {
  const auto result = RunForked(
      [](int stdout_fd, int stderr_fd) {
        WriteToDescriptor(stdout_fd, "from task\n");
        WriteToDescriptor(stderr_fd, "warned\n");
        return 4;
      },
      In(5s));

  EXPECT_EQ(ProcessStatus::kExited, result.status);
  EXPECT_EQ(4, result.exit_code);
  EXPECT_EQ("from task\n", result.stdout_output);
  EXPECT_EQ("warned\n", result.stderr_output);
}

TEST(SubprocessTest, ForkedTaskExceptionIsReportedOnStderr) {
  const auto result = RunForked(
      [](int, int) -> int { throw std::runtime_error("cannot index"); },
      In(5s));

  EXPECT_EQ(ProcessStatus::kExited, result.status);
  EXPECT_NE(0, result.exit_code);
  EXPECT_NE(std::string::npos, result.stderr_output.find("cannot index"));
}

TEST(SubprocessTest, ForkedTaskIsKilledAtDeadline) {
  const auto started = std::chrono::steady_clock::now();

  const auto result = RunForked(
      [](int, int) {
        std::this_thread::sleep_for(30s);
        return 0;
      },
      In(300ms));

  EXPECT_EQ(ProcessStatus::kTimedOut, result.status);
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(SubprocessTest, EmptyArgvIsRejected) {
  EXPECT_THROW(RunProcess(ProcessSpec{}, In(1s)), std::invalid_argument);
}

TEST(CancellationTokenTest, WaitForReturnsEarlyOnCancel) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(50ms);
    token.Cancel();
  });
  const auto started = std::chrono::steady_clock::now();

  EXPECT_TRUE(token.WaitFor(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
  canceller.join();
  EXPECT_TRUE(token.IsCancelled());
}

TEST(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
  CancellationToken token;
  EXPECT_FALSE(token.WaitFor(20ms));
}

} // namespace
} // namespace feedbacker
