#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace feedbacker {

class CancellationToken {
public:
  void Cancel();
  bool IsCancelled() const;

  // Sleeps for up to `duration`; returns true if cancelled meanwhile.
  bool WaitFor(std::chrono::milliseconds duration) const;

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cancelled_cv_;
  bool cancelled_ = false;
};

} // namespace feedbacker
