#pragma once

#include <feedbacker/cancellation.h>
#include <feedbacker/models.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace feedbacker {

struct ProcessSpec {
  std::vector<std::string> argv;
  std::filesystem::path working_directory;
  // Applied on top of the parent environment, or alone when
  // `inherit_environment` is false.
  std::vector<std::pair<std::string, std::string>> environment;
  bool inherit_environment = true;
  std::size_t output_limit = 8 * 1024 * 1024;
};

enum class ProcessStatus { kExited, kSignaled, kTimedOut, kCancelled,
                           kLaunchFailed };

struct ProcessResult {
  ProcessStatus status = ProcessStatus::kExited;
  int exit_code = 0;
  std::string stdout_output;
  std::string stderr_output;
  std::chrono::milliseconds duration{0};
};

// Runs the child in its own process group. When the deadline passes or the
// token is cancelled before the child is reaped, the whole group is killed
// with SIGKILL. Descendants still holding the pipes shortly after the child
// exits are killed too, so no step outlives its caller.
ProcessResult RunProcess(const ProcessSpec &spec, Deadline deadline,
                         const CancellationToken *cancellation = nullptr);

// Receives the stdout and stderr descriptors; returns the exit code.
using ForkedTask = std::function<int(int stdout_fd, int stderr_fd)>;

// Runs `task` in a forked copy of this process, supervised like RunProcess.
// The copy has only the calling thread, so the task must not wait on locks
// other threads may hold. Exceptions it throws are written to stderr and
// turn into exit code 1.
ProcessResult RunForked(const ForkedTask &task, Deadline deadline,
                        const CancellationToken *cancellation = nullptr,
                        std::size_t output_limit = 8 * 1024 * 1024);

// Writes all of `text`, retrying on EINTR. Gives up on other errors.
void WriteToDescriptor(int fd, const std::string &text);

std::string DescribeCommand(const std::vector<std::string> &argv);

} // namespace feedbacker
