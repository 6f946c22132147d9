#include <feedbacker/working_copy.h>

#include <system_error>
#include <utility>

namespace feedbacker {

WorkingCopy::WorkingCopy(std::filesystem::path root, RepositoryRef repository,
                         std::string commit)
    : root_(std::move(root)), repository_(std::move(repository)),
      commit_(std::move(commit)) {}

WorkingCopy::~WorkingCopy() { Release(); }

WorkingCopy::WorkingCopy(WorkingCopy &&other) noexcept
    : root_(std::exchange(other.root_, {})),
      repository_(std::move(other.repository_)),
      commit_(std::move(other.commit_)) {}

WorkingCopy &WorkingCopy::operator=(WorkingCopy &&other) noexcept {
  if (this != &other) {
    Release();
    root_ = std::exchange(other.root_, {});
    repository_ = std::move(other.repository_);
    commit_ = std::move(other.commit_);
  }
  return *this;
}

void WorkingCopy::Release() {
  if (root_.empty()) {
    return;
  }
  std::error_code error;
  std::filesystem::remove_all(root_, error);
  root_.clear();
}

} // namespace feedbacker
