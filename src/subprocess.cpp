#include <feedbacker/subprocess.h>

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace feedbacker {
namespace {

constexpr int kPollSliceMs = 50;
constexpr int kDrainGraceMs = 200;

class Pipe {
public:
  Pipe() {
    if (::pipe2(fds_, O_CLOEXEC) != 0) {
      throw std::runtime_error(std::string("pipe2 failed: ") +
                               std::strerror(errno));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int read_end() const { return fds_[0]; }
  int write_end() const { return fds_[1]; }
  void CloseRead() { Close(fds_[0]); }
  void CloseWrite() { Close(fds_[1]); }

private:
  static void Close(int &fd) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
  int fds_[2]{-1, -1};
};

std::vector<std::string>
BuildEnvironment(const ProcessSpec &spec) {
  std::map<std::string, std::string> merged;
  if (spec.inherit_environment) {
    for (char **entry = environ; entry != nullptr && *entry != nullptr;
         ++entry) {
      const std::string value(*entry);
      const auto separator = value.find('=');
      if (separator != std::string::npos) {
        merged[value.substr(0, separator)] = value.substr(separator + 1);
      }
    }
  }
  for (const auto &[key, value] : spec.environment) {
    merged[key] = value;
  }
  std::vector<std::string> flattened;
  flattened.reserve(merged.size());
  for (const auto &[key, value] : merged) {
    flattened.push_back(key + "=" + value);
  }
  return flattened;
}

std::vector<char *> PointerArray(std::vector<std::string> &values) {
  std::vector<char *> pointers;
  pointers.reserve(values.size() + 1);
  for (auto &value : values) {
    pointers.push_back(value.data());
  }
  pointers.push_back(nullptr);
  return pointers;
}

void AppendLimited(std::string &target, const char *data, std::size_t size,
                   std::size_t limit) {
  if (target.size() >= limit) {
    return;
  }
  target.append(data, std::min(size, limit - target.size()));
}

void KillGroup(pid_t pid) {
  if (::kill(-pid, SIGKILL) != 0 && errno == ESRCH) {
    ::kill(pid, SIGKILL);
  }
}

// Collects the child's output and reaps it. The deadline and the token stay
// in force until the child is reaped, not just while it holds its stdio open.
// On return the child is reaped and `result.status` is final unless the
// caller has more to learn from a clean exit.
void Supervise(pid_t pid, Pipe &stdout_pipe, Pipe &stderr_pipe,
               Deadline deadline, const CancellationToken *cancellation,
               std::size_t output_limit, ProcessResult &result) {
  pollfd fds[2]{};
  fds[0] = {stdout_pipe.read_end(), POLLIN, 0};
  fds[1] = {stderr_pipe.read_end(), POLLIN, 0};
  int open_streams = 2;
  bool killed = false;
  bool reaped = false;
  int status = 0;
  std::chrono::steady_clock::time_point drain_until;

  while (true) {
    if (!reaped) {
      const pid_t waited = ::waitpid(pid, &status, WNOHANG);
      if (waited == pid) {
        reaped = true;
        drain_until = std::chrono::steady_clock::now() +
                      std::chrono::milliseconds(kDrainGraceMs);
      } else if (waited < 0 && errno != EINTR) {
        result.status = ProcessStatus::kLaunchFailed;
        killed = true;
        break;
      }
    }

    const auto now = std::chrono::steady_clock::now();
    if (reaped && (open_streams == 0 || now >= drain_until)) {
      break;
    }
    if (!reaped) {
      if (cancellation != nullptr && cancellation->IsCancelled()) {
        result.status = ProcessStatus::kCancelled;
        killed = true;
        break;
      }
      if (now >= deadline) {
        result.status = ProcessStatus::kTimedOut;
        killed = true;
        break;
      }
    }

    const auto limit = reaped ? drain_until : deadline;
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(limit - now)
            .count();
    const int slice = static_cast<int>(
        std::clamp<long long>(remaining, 1, kPollSliceMs));
    const int ready = ::poll(open_streams > 0 ? fds : nullptr,
                             open_streams > 0 ? 2 : 0, slice);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (reaped) {
        break;
      }
      result.status = ProcessStatus::kLaunchFailed;
      killed = true;
      break;
    }

    char chunk[4096];
    for (int i = 0; i < 2 && ready > 0; ++i) {
      if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
        continue;
      }
      const auto count = ::read(fds[i].fd, chunk, sizeof(chunk));
      if (count > 0) {
        AppendLimited(i == 0 ? result.stdout_output : result.stderr_output,
                      chunk, static_cast<std::size_t>(count), output_limit);
      } else if (count == 0 || errno != EINTR) {
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  if (killed) {
    KillGroup(pid);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exit_code = -1;
    return;
  }
  if (open_streams > 0) {
    // The child exited but left descendants holding its pipes.
    ::kill(-pid, SIGKILL);
  }
  if (WIFEXITED(status)) {
    result.status = ProcessStatus::kExited;
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.status = ProcessStatus::kSignaled;
    result.exit_code = 128 + WTERMSIG(status);
  }
}

} // namespace

std::string DescribeCommand(const std::vector<std::string> &argv) {
  std::string text;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      text.push_back(' ');
    }
    text.append(argv[i]);
  }
  return text;
}

ProcessResult RunProcess(const ProcessSpec &spec, Deadline deadline,
                         const CancellationToken *cancellation) {
  if (spec.argv.empty()) {
    throw std::invalid_argument("ProcessSpec.argv must not be empty");
  }

  const auto started = std::chrono::steady_clock::now();
  ProcessResult result;

  // Everything the child touches is prepared before fork().
  auto arguments = spec.argv;
  auto environment = BuildEnvironment(spec);
  auto argv = PointerArray(arguments);
  auto envp = PointerArray(environment);
  const auto working_directory = spec.working_directory.string();

  Pipe stdout_pipe;
  Pipe stderr_pipe;
  Pipe exec_error_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.status = ProcessStatus::kLaunchFailed;
    result.exit_code = -1;
    result.stderr_output = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(stdout_pipe.write_end(), STDOUT_FILENO);
    ::dup2(stderr_pipe.write_end(), STDERR_FILENO);
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
    }
    if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
      const int error = errno;
      [[maybe_unused]] auto written =
          ::write(exec_error_pipe.write_end(), &error, sizeof(error));
      ::_exit(127);
    }
    ::execvpe(argv[0], argv.data(), envp.data());
    const int error = errno;
    [[maybe_unused]] auto written =
        ::write(exec_error_pipe.write_end(), &error, sizeof(error));
    ::_exit(127);
  }

  // Also set from the parent so a kill cannot race the child's setpgid.
  ::setpgid(pid, pid);
  stdout_pipe.CloseWrite();
  stderr_pipe.CloseWrite();
  exec_error_pipe.CloseWrite();

  Supervise(pid, stdout_pipe, stderr_pipe, deadline, cancellation,
            spec.output_limit, result);

  int exec_error = 0;
  const auto error_bytes =
      ::read(exec_error_pipe.read_end(), &exec_error, sizeof(exec_error));
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);

  const auto finished = result.status == ProcessStatus::kExited ||
                        result.status == ProcessStatus::kSignaled;
  if (finished && error_bytes == static_cast<ssize_t>(sizeof(exec_error))) {
    result.status = ProcessStatus::kLaunchFailed;
    result.exit_code = 127;
    result.stderr_output = "failed to launch '" + spec.argv.front() +
                           "': " + std::strerror(exec_error);
  }
  return result;
}

void WriteToDescriptor(int fd, const std::string &text) {
  std::size_t offset = 0;
  while (offset < text.size()) {
    const auto written =
        ::write(fd, text.data() + offset, text.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    offset += static_cast<std::size_t>(written);
  }
}

ProcessResult RunForked(const ForkedTask &task, Deadline deadline,
                        const CancellationToken *cancellation,
                        std::size_t output_limit) {
  const auto started = std::chrono::steady_clock::now();
  ProcessResult result;

  Pipe stdout_pipe;
  Pipe stderr_pipe;

  const pid_t pid = ::fork();
  if (pid < 0) {
    result.status = ProcessStatus::kLaunchFailed;
    result.exit_code = -1;
    result.stderr_output = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    const int dev_null = ::open("/dev/null", O_RDONLY);
    if (dev_null >= 0) {
      ::dup2(dev_null, STDIN_FILENO);
    }
    int exit_code = 1;
    try {
      exit_code = task(stdout_pipe.write_end(), stderr_pipe.write_end());
    } catch (const std::exception &error) {
      WriteToDescriptor(stderr_pipe.write_end(),
                        std::string(error.what()) + "\n");
    }
    ::_exit(exit_code);
  }

  ::setpgid(pid, pid);
  stdout_pipe.CloseWrite();
  stderr_pipe.CloseWrite();

  Supervise(pid, stdout_pipe, stderr_pipe, deadline, cancellation,
            output_limit, result);
  result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return result;
}

} // namespace feedbacker
