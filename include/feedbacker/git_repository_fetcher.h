#pragma once

#include <feedbacker/interfaces.h>
#include <feedbacker/logging.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace feedbacker {

struct GitFetcherOptions {
  std::string git_binary = "git";
  std::optional<std::filesystem::path> ssh_key;
  std::optional<std::filesystem::path> known_hosts;
  std::chrono::seconds connect_timeout{30};
};

class GitRepositoryFetcher : public RepositoryFetcher {
public:
  explicit GitRepositoryFetcher(GitFetcherOptions options = {},
                                std::shared_ptr<Logger> logger = nullptr);

  WorkingCopy Fetch(const RepositoryRef &repository,
                    const std::filesystem::path &destination,
                    Deadline deadline,
                    const CancellationToken &cancellation) override;

private:
  std::string RunGit(const std::vector<std::string> &arguments,
                     Deadline deadline, const CancellationToken &cancellation,
                     const std::string &stage) const;
  std::optional<std::string>
  ResolveCommit(const std::filesystem::path &checkout,
                const std::string &revision, Deadline deadline,
                const CancellationToken &cancellation) const;
  void CheckCredentials() const;

  GitFetcherOptions options_;
  std::shared_ptr<Logger> logger_;
};

// ssh://, scp-like user@host:path, file:// and absolute local paths.
bool IsSupportedRepositoryUrl(const std::string &url);

ErrorKind ClassifyGitFailure(const std::string &stderr_output);

std::string BuildSshCommand(const GitFetcherOptions &options);

} // namespace feedbacker
