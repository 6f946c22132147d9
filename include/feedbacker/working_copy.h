#pragma once

#include <feedbacker/models.h>

#include <filesystem>

namespace feedbacker {

// Owns a checked-out repository directory. The directory is removed when the
// owner goes away, whatever the job outcome.
class WorkingCopy {
public:
  WorkingCopy() = default;
  WorkingCopy(std::filesystem::path root, RepositoryRef repository,
              std::string commit);
  ~WorkingCopy();

  WorkingCopy(const WorkingCopy &) = delete;
  WorkingCopy &operator=(const WorkingCopy &) = delete;
  WorkingCopy(WorkingCopy &&other) noexcept;
  WorkingCopy &operator=(WorkingCopy &&other) noexcept;

  const std::filesystem::path &root() const { return root_; }
  const RepositoryRef &repository() const { return repository_; }
  // Full commit id the revision resolved to.
  const std::string &commit() const { return commit_; }
  bool valid() const { return !root_.empty(); }

  void Release();

private:
  std::filesystem::path root_;
  RepositoryRef repository_;
  std::string commit_;
};

} // namespace feedbacker
