#include <feedbacker/git_repository_fetcher.h>

#include <feedbacker/job_error.h>
#include <feedbacker/subprocess.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <system_error>
#include <utility>

namespace feedbacker {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

bool ContainsAny(const std::string &haystack,
                 std::initializer_list<const char *> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const char *needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

std::string ShellQuote(const std::string &value) {
  std::string quoted = "'";
  for (const auto character : value) {
    if (character == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.push_back(character);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

std::string LastLine(const std::string &text) {
  const auto trimmed = Trim(text);
  const auto newline = trimmed.find_last_of('\n');
  // git prints the decisive "fatal:" line last.
  return newline == std::string::npos ? trimmed : trimmed.substr(newline + 1);
}

// Removes the staging checkout unless the fetch committed it.
class StagingDirectory {
public:
  explicit StagingDirectory(std::filesystem::path path)
      : path_(std::move(path)) {
    std::error_code error;
    std::filesystem::remove_all(path_, error);
  }
  ~StagingDirectory() {
    if (!committed_) {
      std::error_code error;
      std::filesystem::remove_all(path_, error);
    }
  }
  StagingDirectory(const StagingDirectory &) = delete;
  StagingDirectory &operator=(const StagingDirectory &) = delete;

  const std::filesystem::path &path() const { return path_; }

  void CommitTo(const std::filesystem::path &destination) {
    std::error_code error;
    std::filesystem::rename(path_, destination, error);
    if (error) {
      throw JobError(ErrorKind::kNetwork, "Failed to publish checkout to " +
                                              destination.string() + ": " +
                                              error.message());
    }
    committed_ = true;
  }

private:
  std::filesystem::path path_;
  bool committed_ = false;
};

} // namespace

bool IsSupportedRepositoryUrl(const std::string &url) {
  if (url.empty() || url.front() == '-') {
    return false;
  }
  if (url.rfind("ssh://", 0) == 0 || url.rfind("git+ssh://", 0) == 0 ||
      url.rfind("file://", 0) == 0) {
    return url.find("://") + 3 < url.size();
  }
  if (url.front() == '/') {
    return true;
  }
  static const std::regex kScpLike(R"(^[A-Za-z0-9._-]+@[A-Za-z0-9.-]+:[^/].*$)");
  return std::regex_match(url, kScpLike);
}

ErrorKind ClassifyGitFailure(const std::string &stderr_output) {
  const auto text = ToLower(stderr_output);
  if (ContainsAny(text, {"permission denied", "authentication failed",
                         "host key verification failed",
                         "could not read username", "invalid credentials",
                         "access denied", "no such identity",
                         "bad permissions"})) {
    return ErrorKind::kAuth;
  }
  if (ContainsAny(text, {"does not appear to be a git repository",
                         "repository not found", "does not exist",
                         "unknown revision", "did not match any",
                         "couldn't find remote ref", "not a tree",
                         "not our ref", "invalid reference"})) {
    return ErrorKind::kRevisionNotFound;
  }
  return ErrorKind::kNetwork;
}

std::string BuildSshCommand(const GitFetcherOptions &options) {
  std::string command = "ssh";
  if (options.ssh_key) {
    command += " -i " + ShellQuote(options.ssh_key->string()) +
               " -o IdentitiesOnly=yes";
  }
  if (options.known_hosts) {
    command += " -o UserKnownHostsFile=" +
               ShellQuote(options.known_hosts->string());
  }
  command += " -o BatchMode=yes -o StrictHostKeyChecking=accept-new";
  command += " -o ConnectTimeout=" +
             std::to_string(options.connect_timeout.count());
  return command;
}

GitRepositoryFetcher::GitRepositoryFetcher(GitFetcherOptions options,
                                           std::shared_ptr<Logger> logger)
    : options_(std::move(options)), logger_(EnsureLogger(std::move(logger))) {}

void GitRepositoryFetcher::CheckCredentials() const {
  if (!options_.ssh_key) {
    return;
  }
  std::error_code error;
  const auto status = std::filesystem::status(*options_.ssh_key, error);
  if (error || !std::filesystem::is_regular_file(status)) {
    throw JobError(ErrorKind::kAuth,
                   "SSH key not found: " + options_.ssh_key->string());
  }
  using std::filesystem::perms;
  const auto exposed = perms::group_all | perms::others_all;
  if ((status.permissions() & exposed) != perms::none) {
    throw JobError(ErrorKind::kAuth, "SSH key is accessible by other users: " +
                                         options_.ssh_key->string());
  }
}

std::string
GitRepositoryFetcher::RunGit(const std::vector<std::string> &arguments,
                             Deadline deadline,
                             const CancellationToken &cancellation,
                             const std::string &stage) const {
  ProcessSpec spec;
  spec.argv.push_back(options_.git_binary);
  spec.argv.insert(spec.argv.end(), arguments.begin(), arguments.end());
  spec.environment = {{"GIT_TERMINAL_PROMPT", "0"},
                      {"GIT_SSH_COMMAND", BuildSshCommand(options_)},
                      {"LC_ALL", "C"}};

  logger_->Log(LogLevel::kDebug, "fetch.git",
               {{"stage", stage}, {"command", DescribeCommand(spec.argv)}});
  const auto result = RunProcess(spec, deadline, &cancellation);

  switch (result.status) {
  case ProcessStatus::kExited:
    if (result.exit_code == 0) {
      return result.stdout_output;
    }
    throw JobError(ClassifyGitFailure(result.stderr_output),
                   "git " + stage + " failed: " +
                       LastLine(result.stderr_output));
  case ProcessStatus::kTimedOut:
    throw JobError(ErrorKind::kNetwork, "git " + stage + " timed out");
  case ProcessStatus::kCancelled:
    throw JobError(ErrorKind::kCancelled, "git " + stage + " cancelled");
  case ProcessStatus::kSignaled:
  case ProcessStatus::kLaunchFailed:
    break;
  }
  throw JobError(ErrorKind::kNetwork, "git " + stage + " did not complete: " +
                                          LastLine(result.stderr_output));
}

std::optional<std::string> GitRepositoryFetcher::ResolveCommit(
    const std::filesystem::path &checkout, const std::string &revision,
    Deadline deadline, const CancellationToken &cancellation) const {
  for (const auto &candidate : {revision, "origin/" + revision}) {
    try {
      const auto commit =
          Trim(RunGit({"-C", checkout.string(), "rev-parse", "--verify",
                       "--quiet", "--end-of-options", candidate + "^{commit}"},
                      deadline, cancellation, "resolve"));
      if (!commit.empty()) {
        return commit;
      }
    } catch (const JobError &error) {
      if (error.kind() == ErrorKind::kCancelled ||
          std::chrono::steady_clock::now() >= deadline) {
        throw;
      }
    }
  }
  return std::nullopt;
}

WorkingCopy GitRepositoryFetcher::Fetch(const RepositoryRef &repository,
                                        const std::filesystem::path &destination,
                                        Deadline deadline,
                                        const CancellationToken &cancellation) {
  if (!IsSupportedRepositoryUrl(repository.url)) {
    throw JobError(ErrorKind::kRevisionNotFound,
                   "Unsupported repository url: " + repository.url);
  }
  if (repository.revision.empty() || repository.revision.front() == '-') {
    throw JobError(ErrorKind::kRevisionNotFound,
                   "Invalid revision: " + repository.revision);
  }
  CheckCredentials();

  const auto started = std::chrono::steady_clock::now();
  std::error_code error;
  std::filesystem::create_directories(destination.parent_path(), error);
  if (error) {
    throw JobError(ErrorKind::kNetwork, "Cannot create workspace " +
                                            destination.parent_path().string() +
                                            ": " + error.message());
  }
  std::filesystem::remove_all(destination, error);

  StagingDirectory staging(destination.parent_path() /
                           ("." + destination.filename().string() + ".partial"));

  logger_->Log(LogLevel::kInfo, "fetch.start",
               {{"url", repository.url},
                {"revision", repository.revision},
                {"destination", destination.string()}});

  RunGit({"clone", "--no-checkout", "--quiet", "--", repository.url,
          staging.path().string()},
         deadline, cancellation, "clone");

  const auto commit =
      ResolveCommit(staging.path(), repository.revision, deadline, cancellation);
  if (!commit) {
    throw JobError(ErrorKind::kRevisionNotFound,
                   "Revision not found: " + repository.revision);
  }

  RunGit({"-C", staging.path().string(), "checkout", "--quiet", "--detach",
          *commit},
         deadline, cancellation, "checkout");

  if (cancellation.IsCancelled()) {
    throw JobError(ErrorKind::kCancelled, "fetch cancelled");
  }
  staging.CommitTo(destination);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();
  logger_->Log(LogLevel::kInfo, "fetch.complete",
               {{"url", repository.url},
                {"commit", *commit},
                {"duration_ms", std::to_string(duration_ms)}});
  return WorkingCopy(destination, repository, *commit);
}

} // namespace feedbacker
