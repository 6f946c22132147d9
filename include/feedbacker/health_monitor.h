#pragma once

#include <feedbacker/interfaces.h>
#include <feedbacker/job_scheduler.h>
#include <feedbacker/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace feedbacker {

enum class HealthStatus { kHealthy, kDegraded, kUnavailable };

struct ComponentHealth {
  std::string name;
  bool ok = false;
  std::string detail;
};

struct HealthReport {
  HealthStatus status = HealthStatus::kUnavailable;
  bool accepting_work = false;
  std::vector<ComponentHealth> components;
};

// Synchronous readiness check for the HTTP layer. Degraded means the
// scheduler runs but cannot take new work or the store does not answer.
class HealthMonitor {
public:
  HealthMonitor(std::shared_ptr<const JobScheduler> scheduler,
                std::shared_ptr<ResultStore> store,
                std::shared_ptr<Logger> logger = nullptr);

  HealthReport Check() const;

private:
  std::shared_ptr<const JobScheduler> scheduler_;
  std::shared_ptr<ResultStore> store_;
  std::shared_ptr<Logger> logger_;
};

std::string ToString(HealthStatus status);
std::string ToJson(const HealthReport &report);

} // namespace feedbacker
