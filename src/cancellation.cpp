#include <feedbacker/cancellation.h>

namespace feedbacker {

void CancellationToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cancelled_cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cancelled_cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

} // namespace feedbacker
