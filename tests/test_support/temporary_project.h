#ifndef FEEDBACKER_TEST_SUPPORT_TEMPORARY_PROJECT_H
#define FEEDBACKER_TEST_SUPPORT_TEMPORARY_PROJECT_H

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace feedbacker {
namespace test {

class TemporaryProject {
public:
  explicit TemporaryProject(const std::string &prefix = "feedbacker-test") {
    static std::atomic<int> counter{0};
    const auto timestamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            (prefix + "-" + std::to_string(::getpid()) + "-" +
             std::to_string(timestamp) + "-" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TemporaryProject() {
    std::error_code error;
    std::filesystem::remove_all(root_, error);
  }

  TemporaryProject(const TemporaryProject &) = delete;
  TemporaryProject &operator=(const TemporaryProject &) = delete;

  std::filesystem::path AddFile(const std::filesystem::path &relative,
                                const std::string &content = "") const {
    const auto full_path = root_ / relative;
    std::filesystem::create_directories(full_path.parent_path());
    std::ofstream stream(full_path);
    stream << content;
    return full_path;
  }

  const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace test
} // namespace feedbacker

#endif // FEEDBACKER_TEST_SUPPORT_TEMPORARY_PROJECT_H
